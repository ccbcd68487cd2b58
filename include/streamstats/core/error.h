#ifndef STREAMSTATS_CORE_ERROR_H_
#define STREAMSTATS_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace streamstats {
namespace core {

/**
 * @brief Base class for all streamstats errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,   // Malformed spec strings and configuration values
        NO_ENDPOINTS = 2,       // Nothing to stream from, retry later
        UNAVAILABLE = 3,        // Endpoint could not be opened
        TIMEOUT = 4,
        INTERNAL = 5
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
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating that no streaming endpoint is configured
 */
class NoEndpointsError : public Error {
public:
    explicit NoEndpointsError(const std::string& message = "No URLs available for streaming")
        : Error(message, Code::NO_ENDPOINTS) {}
};

} // namespace core
} // namespace streamstats

#endif // STREAMSTATS_CORE_ERROR_H_
