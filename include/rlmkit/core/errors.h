#pragma once

#include "rlmkit/api_export.h"
#include <stdexcept>
#include <string>

namespace rlmkit {

// Base class for every error rlmkit throws across its public API
class RLMKIT_API RlmkitError : public std::runtime_error {
public:
    explicit RlmkitError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid configuration or context detected at construction time.
// Always fatal for the run that triggered it.
class RLMKIT_API ConfigError : public RlmkitError {
public:
    explicit ConfigError(const std::string& message) : RlmkitError(message) {}
};

// Run() called on a session that was already torn down
class RLMKIT_API SessionClosedError : public RlmkitError {
public:
    explicit SessionClosedError(const std::string& message) : RlmkitError(message) {}
};

// Raised by DelegateClient implementations; llm_query turns it into text
class RLMKIT_API DelegateError : public RlmkitError {
public:
    explicit DelegateError(const std::string& message) : RlmkitError(message) {}
};

} // namespace rlmkit
