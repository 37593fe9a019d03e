#pragma once

#include "rockseg/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception hierarchy for the rockseg pipeline
 */

namespace rockseg {
namespace core {

/**
 * @brief Base exception class for all rockseg exceptions
 *
 * Carries a result code, the bare message and the context (usually the
 * throwing file and line) so callers can retry with corrected input.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Index, classifier or reconstruction given zero points
 */
class EmptyInputException : public Exception {
public:
    EmptyInputException(const std::string& message,
                        const std::string& context = "")
        : Exception(ResultCode::ERROR_EMPTY_INPUT, message, context) {}
};

/**
 * @brief Seed set empty, out of range or computed for another cloud
 */
class InvalidSeedException : public Exception {
public:
    InvalidSeedException(const std::string& message,
                         const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_SEED, message, context) {}
};

class DegenerateGeometryException : public Exception {
public:
    DegenerateGeometryException(const std::string& message,
                                const std::string& context = "")
        : Exception(ResultCode::ERROR_DEGENERATE_GEOMETRY, message, context) {}
};

/**
 * @brief A pipeline stage was invoked before its prerequisite completed
 */
class StageOrderException : public Exception {
public:
    StageOrderException(const std::string& message,
                        const std::string& context = "")
        : Exception(ResultCode::ERROR_STAGE_ORDER, message, context) {}
};

/**
 * @brief Segmentation or reconstruction collaborator reported an error
 */
class ExternalComponentException : public Exception {
public:
    ExternalComponentException(const std::string& message,
                               const std::string& context = "")
        : Exception(ResultCode::ERROR_EXTERNAL_COMPONENT, message, context) {}
};

class InvalidParameterException : public Exception {
public:
    InvalidParameterException(const std::string& message,
                              const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_PARAMETER, message, context) {}
};

class CancelledException : public Exception {
public:
    CancelledException(const std::string& message,
                       const std::string& context = "")
        : Exception(ResultCode::ERROR_CANCELLED, message, context) {}
};

/**
 * @brief File I/O related exceptions
 */
class FileException : public Exception {
public:
    FileException(ResultCode code,
                  const std::string& message,
                  const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define ROCKSEG_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define ROCKSEG_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace rockseg
