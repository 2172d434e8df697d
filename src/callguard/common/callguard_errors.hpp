/**
 * @file callguard_errors.hpp
 */
#pragma once
#include "callguard/common/common.hpp"

namespace callguard
{

/**
 * @brief Error codes for misuse of the callguard API.
 *
 * @note Faults raised by user callables are never converted to these codes;
 * they propagate with their original type.
 */
enum class CallGuardErrorCode
{
    InvalidPolicy,
    CapabilityNotFound,
    DuplicateCapability,
    SignatureMismatch,
    ReadOnlyCapability,
    TimeoutExceeded
};

/**
 * @brief Get a printable name for an error code.
 */
const char* to_string(CallGuardErrorCode code) noexcept;

/**
 * @brief Exception class for callguard errors.
 *
 * @details
 * `CallGuardError` is thrown when a policy is configured with invalid values,
 * when a capability lookup or rebind cannot be honored, and by
 * `TimeoutGuard::run()` when a deadline passes with no fallback available.
 * Each exception carries an error code and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class CallGuardError : public std::exception
{
public:
    /**
     * @brief Construct a CallGuardError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    CallGuardError(CallGuardErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    CallGuardErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    CallGuardErrorCode m_code;
    std::string m_message;
};

} // namespace callguard
