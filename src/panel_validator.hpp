// panel_validator.hpp
// Formatting rules for panel files; all problems are collected in one pass

#pragma once

#include <string>
#include <vector>

namespace genepanel {

enum class IssueKind {
    FormatError,      // missing trailing newline, whitespace inside a gene line
    OrderError,       // genes not sorted case-insensitively
    DuplicateError,   // exact repeat
    DuplicateWarning, // repeat ignoring case
    ReadError         // file could not be read
};

const char* issue_kind_name(IssueKind kind);

struct ValidationIssue {
    IssueKind kind = IssueKind::FormatError;
    size_t line = 0;       // 1-based, 0 = whole file
    size_t other_line = 0; // first occurrence for duplicates
    std::string gene;
    std::string message;
};

struct ValidationResult {
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;

    bool ok() const { return errors.empty(); }
};

struct ValidatorOptions {
    // Files case-only duplicates under errors instead of warnings.
    bool case_duplicates_are_errors = false;
};

ValidationResult validate_panel(const std::string& text,
    const ValidatorOptions& options = ValidatorOptions());

// "<path>:<line>: <message>", or "<path>: <message>" for whole-file issues.
std::string format_issue(const std::string& path, const ValidationIssue& issue);

} // namespace genepanel
