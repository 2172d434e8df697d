/**
 * @file clock.hpp
 * @brief Monotonic clock capability.
 */
#pragma once
#include "callguard/common/common.hpp"

namespace callguard
{

/**
 * @brief Interface for a monotonic clock.
 *
 * @details
 * Used for elapsed-time measurement of outcomes and timed calls. Resolution
 * must be at least one millisecond.
 */
class IClock
{
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~IClock() = default;

    virtual time_point now() const noexcept = 0;
};

/**
 * @brief IClock backed by std::chrono::steady_clock.
 */
class SteadyClock : public IClock
{
public:
    time_point now() const noexcept override
    {
        return std::chrono::steady_clock::now();
    }
};

/**
 * @brief Shared process-wide SteadyClock instance.
 */
inline const IClock& default_clock() noexcept
{
    static const SteadyClock clock;
    return clock;
}

/**
 * @brief Milliseconds, as a double, for log messages.
 */
template <typename Rep, typename Period>
double to_millis(std::chrono::duration<Rep, Period> d) noexcept
{
    return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace callguard
