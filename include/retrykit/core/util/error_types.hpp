/**
 * @file error_types.hpp
 * @brief Error type definitions for retrykit.
 *
 * Provides the error codes and exception classes a retry session can end with,
 * and predicates that classify an error even when it has been wrapped with
 * std::throw_with_nested by an outer layer.
 *
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace retrykit {

    /**
     * @enum RetryErr
     * @brief Error codes for retry sessions.
     *
     * - InvalidConfiguration: the call arguments were rejected before any attempt
     * - AttemptsExceeded: the attempt budget ran out
     * - RetryStopped: the stop token was asserted between attempts
     */
    enum class RetryErr : int {
        InvalidConfiguration = 1, ///< Rejected by validation
        AttemptsExceeded,         ///< Attempt budget exhausted
        RetryStopped              ///< Stopped externally
    };

    /**
     * @brief Get a short name for an error code.
     */
    const char* retryErrName(RetryErr code);

    /**
     * @class RetryError
     * @brief Base class of every error raised by retrykit itself.
     *
     * Errors raised by the retried operation are never converted into a
     * RetryError except as the lastError() of AttemptsExceeded or RetryStopped.
     */
    class RetryError : public std::runtime_error {
    public:
        RetryError(RetryErr code, const std::string& msg)
            : std::runtime_error(msg), code_(code) {}

        RetryErr code() const noexcept { return code_; }

    private:
        RetryErr code_;
    };

    /**
     * @class InvalidConfiguration
     * @brief Raised by validate() when the call arguments cannot be used.
     */
    class InvalidConfiguration : public RetryError {
    public:
        /**
         * @param field Name of the offending field (e.g. "func", "delay")
         * @param msg Human readable message
         */
        InvalidConfiguration(std::string field, const std::string& msg)
            : RetryError(RetryErr::InvalidConfiguration, msg), field_(std::move(field)) {}

        const std::string& field() const noexcept { return field_; }

    private:
        std::string field_;
    };

    /**
     * @class AttemptsExceeded
     * @brief Raised when every permitted attempt failed.
     *
     * what() reads "attempt count exceeded: <last error text>".
     */
    class AttemptsExceeded : public RetryError {
    public:
        explicit AttemptsExceeded(std::exception_ptr lastError);

        /**
         * @brief The error thrown by the final attempt.
         */
        const std::exception_ptr& lastError() const noexcept { return lastError_; }

    private:
        std::exception_ptr lastError_;
    };

    /**
     * @class RetryStopped
     * @brief Raised when the stop token was asserted before a further attempt.
     *
     * what() reads "retry stopped: <last error text>".
     */
    class RetryStopped : public RetryError {
    public:
        explicit RetryStopped(std::exception_ptr lastError);

        const std::exception_ptr& lastError() const noexcept { return lastError_; }

    private:
        std::exception_ptr lastError_;
    };

    /**
     * @brief Render the message of a captured exception.
     *
     * Exceptions not derived from std::exception render as "unknown error",
     * a null pointer renders as "no error".
     */
    std::string describeError(const std::exception_ptr& err);

    /**
     * @brief Find the operation error behind a retry error.
     *
     * Walks std::nested_exception wrappers. If an AttemptsExceeded or
     * RetryStopped is found its lastError() is returned, otherwise the
     * pointer passed in is returned unchanged.
     */
    std::exception_ptr lastErrorOf(const std::exception_ptr& err);

    /// @name Classification predicates
    /// Each one also looks through std::nested_exception wrappers.
    /// @{
    bool isAttemptsExceeded(const std::exception& e);
    bool isAttemptsExceeded(const std::exception_ptr& err);
    bool isRetryStopped(const std::exception& e);
    bool isRetryStopped(const std::exception_ptr& err);
    bool isInvalidConfiguration(const std::exception& e);
    bool isInvalidConfiguration(const std::exception_ptr& err);
    /// @}

}
