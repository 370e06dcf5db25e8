#ifndef GNMIREVERSE_CORE_ERROR_H_
#define GNMIREVERSE_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace gnmireverse {
namespace core {

/**
 * @brief Base class for all gnmireverse errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        CONFIG = 2,
        DIAL = 3,
        STREAM = 4,
        CANCELLED = 5,
        INTERNAL = 6
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Malformed TLS inputs or command line; fatal at startup
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) 
        : Error(message, Code::CONFIG) {}
    explicit ConfigError(const char* message) 
        : Error(message, Code::CONFIG) {}
};

/**
 * @brief Connection establishment to the target or collector failed
 */
class DialError : public Error {
public:
    explicit DialError(const std::string& message) 
        : Error(message, Code::DIAL) {}
    explicit DialError(const char* message) 
        : Error(message, Code::DIAL) {}
};

/**
 * @brief Opening, sending on or receiving from a session stream failed
 */
class StreamError : public Error {
public:
    explicit StreamError(const std::string& message) 
        : Error(message, Code::STREAM) {}
    explicit StreamError(const char* message) 
        : Error(message, Code::STREAM) {}
};

/**
 * @brief A session observed that its cancellation scope was cancelled
 */
class CancellationError : public Error {
public:
    explicit CancellationError(const std::string& message) 
        : Error(message, Code::CANCELLED) {}
    explicit CancellationError(const char* message) 
        : Error(message, Code::CANCELLED) {}
};

/**
 * @brief Human readable name of an error code, for logs
 */
const char* CodeName(Error::Code code);

} // namespace core
} // namespace gnmireverse

#endif // GNMIREVERSE_CORE_ERROR_H_
