#pragma once

#include <string>
#include <vector>

namespace Crimson::Combat {

// ============================================================================
// Validation Result
// ============================================================================

/**
 * @brief Result of validating a configuration object
 *
 * Errors mark the configuration invalid; warnings are informational.
 * Each message is prefixed with the JSON key path it refers to.
 */
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void AddError(const std::string& path, const std::string& message) {
        valid = false;
        errors.push_back("[" + path + "] " + message);
    }

    void AddWarning(const std::string& path, const std::string& message) {
        warnings.push_back("[" + path + "] " + message);
    }

    void Merge(const ValidationResult& other) {
        if (!other.valid) valid = false;
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    }
};

} // namespace Crimson::Combat
