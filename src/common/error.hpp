#pragma once

#include <string>
#include <stdexcept>

namespace wordguard {
namespace common {

// Error codes
enum class ErrorCode {
    SUCCESS = 0,

    // Argument errors
    INVALID_ARGUMENT = 2000,
    INVALID_CONFIG = 2001,
    INVALID_STATE = 2002,

    // I/O errors
    IO_ERROR = 4000,

    // Other errors
    UNKNOWN_ERROR = 9999
};

// Base exception class
class Exception : public std::runtime_error {
public:
    Exception(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Argument exception
class ArgumentException : public Exception {
public:
    ArgumentException(const std::string& message)
        : Exception(ErrorCode::INVALID_ARGUMENT, message) {}
};

// Configuration exception
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message)
        : Exception(ErrorCode::INVALID_CONFIG, message) {}
};

// State exception
class StateException : public Exception {
public:
    StateException(const std::string& message)
        : Exception(ErrorCode::INVALID_STATE, message) {}
};

// File access exception
class IOException : public Exception {
public:
    IOException(const std::string& message)
        : Exception(ErrorCode::IO_ERROR, message) {}
};

// Error handling macros
#define CHECK_ARG(condition, message) { \
    if (!(condition)) { \
        throw wordguard::common::ArgumentException(message); \
    } \
}

#define CHECK_CONFIG(condition, message) { \
    if (!(condition)) { \
        throw wordguard::common::ConfigException(message); \
    } \
}

#define CHECK_STATE(condition, message) { \
    if (!(condition)) { \
        throw wordguard::common::StateException(message); \
    } \
}

} // namespace common
} // namespace wordguard
