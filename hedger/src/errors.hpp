#pragma once
#include <stdexcept>
#include <string>

// A required dependency is missing or misconfigured. Fatal, never retried.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// A ranking or theme classification call failed or timed out.
class CapabilityFailure : public std::runtime_error {
public:
    explicit CapabilityFailure(const std::string& what) : std::runtime_error(what) {}
};

// A stored record could not be decoded.
class DeserializationError : public std::runtime_error {
public:
    explicit DeserializationError(const std::string& what) : std::runtime_error(what) {}
};
