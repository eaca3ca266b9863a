// include/onboard/error.hpp
// Single error class with kind enum, thrown across the engine boundary.

#pragma once

#include "types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace onboard {

enum class ErrorKind {
    Configuration,  // Invalid config or unreadable catalog at construction
    Validation,     // Payload rejected, or completion gated on missing steps
    NotFound,       // Unknown session id
    InvalidState,   // Operation not legal in the current session status
    Expired,        // Session TTL elapsed
    Analysis,       // Image statistics could not be computed
    Storage,        // Session store refused a write
    Callback        // An integration callback threw
};

class OnboardError : public std::exception {
public:
    OnboardError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }

    // Field-level errors and non-blocking warnings of a rejected payload.
    const std::vector<std::string>& errors() const noexcept { return errors_; }
    const std::vector<std::string>& warnings() const noexcept { return warnings_; }

    // Required steps still missing when completion was refused.
    const std::vector<StepId>& missing_steps() const noexcept { return missing_steps_; }

    static OnboardError configuration(std::string msg) {
        return OnboardError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static OnboardError validation(std::vector<std::string> errors,
                                   std::vector<std::string> warnings = {}) {
        std::string msg = "validation error";
        if (!errors.empty()) {
            msg += ": " + errors.front();
            if (errors.size() > 1) {
                msg += " (and " + std::to_string(errors.size() - 1) + " more)";
            }
        }
        OnboardError err(ErrorKind::Validation, std::move(msg));
        err.errors_ = std::move(errors);
        err.warnings_ = std::move(warnings);
        return err;
    }

    static OnboardError missing_steps(std::vector<StepId> steps) {
        std::string msg = "validation error: required steps not completed:";
        std::vector<std::string> errors;
        for (StepId step : steps) {
            msg += " ";
            msg += to_string(step);
            errors.push_back(std::string("step '") + to_string(step) + "' is not completed");
        }
        OnboardError err(ErrorKind::Validation, std::move(msg));
        err.errors_ = std::move(errors);
        err.missing_steps_ = std::move(steps);
        return err;
    }

    static OnboardError not_found(const std::string& session_id) {
        return OnboardError(ErrorKind::NotFound, "onboarding session not found: " + session_id);
    }

    static OnboardError invalid_state(std::string msg) {
        return OnboardError(ErrorKind::InvalidState, "invalid state: " + msg);
    }

    static OnboardError expired(const std::string& session_id) {
        return OnboardError(ErrorKind::Expired, "onboarding session has expired: " + session_id);
    }

    static OnboardError analysis(std::string msg) {
        return OnboardError(ErrorKind::Analysis, "analysis error: " + msg);
    }

    static OnboardError storage(std::string msg) {
        return OnboardError(ErrorKind::Storage, "storage error: " + msg);
    }

    static OnboardError callback(const std::string& name, const std::string& msg) {
        return OnboardError(ErrorKind::Callback, name + " callback failed: " + msg);
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
    std::vector<StepId> missing_steps_;
};

} // namespace onboard
