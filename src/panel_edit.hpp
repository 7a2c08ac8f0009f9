// panel_edit.hpp
// Checks an edited panel against the stored one before the change is submitted

#pragma once

#include <string>

#include "panel_diff.hpp"
#include "panel_validator.hpp"

namespace genepanel {

struct EditPreview {
    std::string content; // edited text, newline-terminated
    ValidationResult validation;
    DiffResult diff;     // stored -> edited
    std::string summary;

    bool submittable() const { return validation.ok(); }
};

// Case-only duplicates block submission here.
EditPreview preview_edit(const std::string& panel_name, const std::string& original,
    const std::string& edited);

} // namespace genepanel
