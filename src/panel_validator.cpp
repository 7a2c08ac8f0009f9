// panel_validator.cpp
// Formatting rules for panel files; all problems are collected in one pass

#include "panel_validator.hpp"
#include "panel_text.hpp"

#include <algorithm>
#include <unordered_map>

namespace genepanel {

const char* issue_kind_name(IssueKind kind) {
    switch (kind) {
    case IssueKind::FormatError: return "FormatError";
    case IssueKind::OrderError: return "OrderError";
    case IssueKind::DuplicateError: return "DuplicateError";
    case IssueKind::DuplicateWarning: return "DuplicateWarning";
    case IssueKind::ReadError: return "ReadError";
    }
    return "Unknown";
}

static ValidationIssue make_issue(IssueKind kind, size_t line, size_t other_line,
    const std::string& gene, const std::string& message) {
    ValidationIssue issue;
    issue.kind = kind;
    issue.line = line;
    issue.other_line = other_line;
    issue.gene = gene;
    issue.message = message;
    return issue;
}

// ==================== VALIDATION ====================

ValidationResult validate_panel(const std::string& text, const ValidatorOptions& options) {
    ValidationResult result;
    const std::string content = strip_bom(text);

    if (!content.empty() && content.back() != '\n') {
        result.errors.push_back(make_issue(IssueKind::FormatError, 0, 0, "",
            "file must end with a newline"));
    }

    std::vector<std::string> genes;
    std::unordered_map<std::string, size_t> first_exact;
    std::unordered_map<std::string, std::pair<std::string, size_t>> first_folded;

    auto lines = split_lines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        const size_t line_num = i + 1;
        std::string line = trim(lines[i]);
        if (line.empty() || line[0] == '#') continue;

        if (has_whitespace(line)) {
            result.errors.push_back(make_issue(IssueKind::FormatError, line_num, 0, line,
                "invalid entry '" + line + "' (contains whitespace)"));
            continue;
        }

        auto exact = first_exact.find(line);
        if (exact != first_exact.end()) {
            result.errors.push_back(make_issue(IssueKind::DuplicateError, line_num, exact->second, line,
                "duplicate gene '" + line + "' (first seen on line " +
                std::to_string(exact->second) + ")"));
        }
        else {
            std::string folded = to_lower(line);
            auto near = first_folded.find(folded);
            if (near != first_folded.end()) {
                ValidationIssue issue = make_issue(IssueKind::DuplicateWarning, line_num,
                    near->second.second, line,
                    "gene '" + line + "' differs only in case from '" + near->second.first +
                    "' on line " + std::to_string(near->second.second));
                if (options.case_duplicates_are_errors) result.errors.push_back(issue);
                else result.warnings.push_back(issue);
            }
            else {
                first_folded.emplace(folded, std::make_pair(line, line_num));
            }
            first_exact.emplace(line, line_num);
        }

        genes.push_back(line);
    }

    // whole list against its stable case-insensitive sort
    std::vector<std::string> sorted = genes;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const std::string& a, const std::string& b) { return to_lower(a) < to_lower(b); });
    auto mismatch = std::mismatch(genes.begin(), genes.end(), sorted.begin());
    if (mismatch.first != genes.end()) {
        result.errors.push_back(make_issue(IssueKind::OrderError, 0, 0, *mismatch.first,
            "genes must be sorted alphabetically (case-insensitive); first out-of-order entry '" +
            *mismatch.first + "'"));
    }

    return result;
}

std::string format_issue(const std::string& path, const ValidationIssue& issue) {
    if (issue.line == 0) return path + ": " + issue.message;
    return path + ":" + std::to_string(issue.line) + ": " + issue.message;
}

} // namespace genepanel
