#ifndef PROTOLAYOUT_CORE_ERRORS_H
#define PROTOLAYOUT_CORE_ERRORS_H

#include <functional>
#include <stdexcept>
#include <string>

namespace protolayout {

// Root of every error raised by the library. Driver code catches this type
// at the top level; nothing inside the core catches it.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Malformed unit literal, unit token, PID string or document shape.
class ParseError : public Error {
public:
    explicit ParseError(const std::string& message) : Error(message) {}
};

// A policy was prepared against a layout it cannot serve.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message) : Error(message) {}
};

// Runtime pagination failure: unknown policy, page ceiling, contract violation.
class PaginationError : public Error {
public:
    explicit PaginationError(const std::string& message) : Error(message) {}
};

// Duplicate or unknown PID, unknown prefix, prefix/type mismatch.
class RegistryError : public Error {
public:
    explicit RegistryError(const std::string& message) : Error(message) {}
};

// Receives recoverable conditions (skipped CSV rows, ignored bindings).
using WarningHandler = std::function<void(const std::string&)>;

} // namespace protolayout

#endif // PROTOLAYOUT_CORE_ERRORS_H
