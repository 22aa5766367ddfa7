#pragma once

#include "core/result.hpp"
#include <stdexcept>
#include <string>

namespace ek::core {

// Base of the exceptions thrown across the edit pipeline.
class EditError : public std::runtime_error {
public:
    EditError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Missing or malformed action parameters. Raised before any clip is touched.
class ValidationError : public EditError {
public:
    explicit ValidationError(const std::string& message)
        : EditError(ErrorCode::Validation, message) {}
};

class UnknownActionError : public EditError {
public:
    explicit UnknownActionError(const std::string& tag)
        : EditError(ErrorCode::UnknownAction, "Unknown action: " + tag), tag_(tag) {}

    const std::string& tag() const noexcept { return tag_; }

private:
    std::string tag_;
};

// A host call failed; recovered per clip by the dispatcher.
class HostOperationError : public EditError {
public:
    explicit HostOperationError(const std::string& message)
        : EditError(ErrorCode::HostOperation, message) {}
};

} // namespace ek::core
