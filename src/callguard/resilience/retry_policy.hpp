/**
 * @file retry_policy.hpp
 * @brief RetryPolicy: retry with backoff on matched faults.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/log_sink.hpp"
#include "callguard/resilience/describe_value.hpp"
#include "callguard/resilience/fault_filter.hpp"
#include "callguard/resilience/fault_locator.hpp"
#include "callguard/resilience/settlement.hpp"

namespace callguard
{

/**
 * @brief Configuration for RetryPolicy.
 */
struct RetryConfig
{
    /**
     * @brief Total number of attempts, the first one included.
     * @details Values below 1 mean "retry forever".
     */
    int max_attempts{3};

    /**
     * @brief Delay before the first retry.
     */
    std::chrono::milliseconds initial_delay{1000};

    /**
     * @brief Factor applied to the delay after every retry. Must be >= 1.0.
     */
    double backoff_factor{1.0};

    /**
     * @brief Upper bound for the delay; zero means unbounded.
     */
    std::chrono::milliseconds max_delay{0};

    /**
     * @brief Faults that trigger a retry; others propagate immediately.
     */
    FaultFilter matched_faults{};
};

/**
 * @brief Blocking sleep used between attempts.
 */
using Sleeper = std::function<void(std::chrono::nanoseconds)>;

/**
 * @brief Check a RetryConfig.
 * @throws CallGuardError (InvalidPolicy) on a negative delay or a backoff
 *         factor below 1.0.
 */
void validate(const RetryConfig& config);

/**
 * @brief The delay that follows @p current, after backoff and capping.
 */
std::chrono::nanoseconds next_retry_delay(const RetryConfig& config, std::chrono::nanoseconds current);

/**
 * @brief Sleeper backed by std::this_thread::sleep_for.
 */
Sleeper thread_sleeper();

namespace detail
{

/**
 * @brief Attempt number that follows @p attempt; sticks at the maximum.
 */
constexpr std::uint64_t next_attempt(std::uint64_t attempt) noexcept
{
    return attempt == std::numeric_limits<std::uint64_t>::max() ? attempt : attempt + 1;
}

void log_retry_scheduled(ILogSink& sink, const std::string& label, std::uint64_t attempt,
                         const RetryConfig& config, const std::exception_ptr& fault,
                         std::chrono::nanoseconds delay, const std::string& fallback);

void log_retry_exhausted(ILogSink& sink, const std::string& label, std::uint64_t attempts,
                         const std::exception_ptr& fault, const std::string& fallback);

} // namespace detail

/**
 * @brief Decorator that retries a callable on matched faults.
 *
 * @details
 * State machine per call:
 * @code
 *   ATTEMPT -> SUCCESS                      (return the value)
 *   ATTEMPT -> FAULT (unmatched)            (rethrow, no attempt consumed)
 *   ATTEMPT -> FAULT -> SLEEP -> ATTEMPT    (attempts remain)
 *   ATTEMPT -> FAULT -> EXHAUSTED           (fallback, or rethrow last fault)
 * @endcode
 * With `max_attempts < 1` the policy never reaches EXHAUSTED. The delay
 * starts at `initial_delay` and is multiplied by `backoff_factor` after every
 * retry. Each matched fault is logged at warning level with the attempt count
 * and the pending fallback; exhaustion is logged at error level.
 *
 * Arguments are passed to the callable as lvalues on every attempt, so
 * move-only arguments are not consumed by a failed attempt.
 *
 * @tparam R Return type of the decorated callables.
 *
 * @par Thread Safety
 * - Immutable after construction; run() may be called concurrently.
 * - Sleeping blocks only the calling thread.
 */
template <typename R>
class RetryPolicy
{
    static_assert(!std::is_reference_v<R>, "RetryPolicy: reference results are not supported");

public:
    using value_type = value_t<R>;

    /**
     * @throws CallGuardError (InvalidPolicy) if @p config is invalid.
     */
    explicit RetryPolicy(
        RetryConfig config = {},
        Fallback<R> fallback = std::nullopt,
        LogSinkPtr sink = {},
        Sleeper sleeper = {})
        : m_config{std::move(config)}
        , m_fallback{std::move(fallback)}
        , m_sink{resolve_sink(std::move(sink))}
        , m_sleeper{sleeper ? std::move(sleeper) : thread_sleeper()}
    {
        validate(m_config);
    }

    const RetryConfig& config() const noexcept
    {
        return m_config;
    }

    const Fallback<R>& fallback() const noexcept
    {
        return m_fallback;
    }

    template <typename F, typename... Args>
    Settlement<value_type> settle(const std::string& label, F& fn, Args&... args) const
    {
        const bool unbounded = m_config.max_attempts < 1;
        int remaining = m_config.max_attempts;
        std::uint64_t attempt = 0;
        std::chrono::nanoseconds delay = m_config.initial_delay;
        std::exception_ptr last_fault;

        for (;;)
        {
            attempt = detail::next_attempt(attempt);
            try
            {
                return Recovered<value_type>{invoke_for_value(fn, args...), false};
            }
            catch (...)
            {
                last_fault = std::current_exception();
            }

            if (!m_config.matched_faults.matches(last_fault))
            {
                return Propagated{last_fault};
            }

            if (!unbounded)
            {
                --remaining;
            }
            if (unbounded || remaining > 0)
            {
                detail::log_retry_scheduled(*m_sink, label, attempt, m_config, last_fault,
                                            delay, detail::describe_fallback(m_fallback));
                m_sleeper(delay);
                delay = next_retry_delay(m_config, delay);
                continue;
            }

            detail::log_retry_exhausted(*m_sink, label, attempt, last_fault,
                                        detail::describe_fallback(m_fallback));
            if (m_fallback)
            {
                return Recovered<value_type>{*m_fallback, true};
            }
            return Propagated{last_fault};
        }
    }

    template <typename F, typename... Args>
    R run_labeled(const std::string& label, F& fn, Args&&... args) const
    {
        return resolve<R>(settle(label, fn, args...));
    }

    template <typename F, typename... Args>
    R run(F&& fn, Args&&... args) const
    {
        return run_labeled("callable", fn, std::forward<Args>(args)...);
    }

    template <typename F>
    auto wrap(F fn, std::string label = "callable") const
    {
        return [policy = *this, fn = std::move(fn), label = std::move(label)](auto&&... args) mutable -> R {
            return policy.run_labeled(label, fn, std::forward<decltype(args)>(args)...);
        };
    }

private:
    RetryConfig m_config;
    Fallback<R> m_fallback;
    LogSinkPtr m_sink;
    Sleeper m_sleeper;
};

} // namespace callguard
