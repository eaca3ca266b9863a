// include/onboard/validation_result.hpp
// Errors block a step; warnings only inform.

#pragma once

#include <string>
#include <vector>

namespace onboard {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string message) {
        errors.push_back(std::move(message));
        is_valid = false;
    }

    void add_warning(std::string message) {
        warnings.push_back(std::move(message));
    }

    // Append another result; validity is the conjunction of both.
    void merge(const ValidationResult& other) {
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
        is_valid = is_valid && other.is_valid && errors.empty();
    }
};

} // namespace onboard
