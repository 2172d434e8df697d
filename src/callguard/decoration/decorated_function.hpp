/**
 * @file decorated_function.hpp
 * @brief Compose the resilience decorators around one std::function.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/decoration/decoration_policy.hpp"
#include "callguard/resilience/call_timer.hpp"
#include "callguard/resilience/exception_handler.hpp"
#include "callguard/resilience/retry_policy.hpp"
#include "callguard/resilience/timeout_guard.hpp"

namespace callguard
{

/**
 * @brief Build the decorated form of @p original under @p policy.
 *
 * @details
 * The result owns copies of every decorator and of @p original; it does not
 * refer to the policy after returning.
 *
 * The timeout layer returns the policy's fallback for R when the deadline
 * passes, independently of `policy.matched_faults`. Workers it abandons are
 * handed to @p abandoned when one is given.
 *
 * @throws CallGuardError (InvalidPolicy) if the policy's retry or timeout
 *         settings are invalid.
 */
template <typename R, typename... Args>
std::function<R(Args...)> decorate_function(
    std::function<R(Args...)> original,
    const std::string& name,
    const DecorationPolicy& policy,
    AbandonedWorkersPtr abandoned = {})
{
    auto sink = resolve_sink(policy.sink);
    std::function<R(Args...)> op = std::move(original);

    if (policy.timeout)
    {
        TimeoutConfig timeout_config;
        timeout_config.limit = *policy.timeout;
        TimeoutGuard<R> guard{timeout_config, policy.fallback_for<R>(), sink, std::move(abandoned)};
        op = guard.wrap(std::move(op), name);
    }

    if (policy.retry_attempts > 1)
    {
        RetryConfig retry_config;
        retry_config.max_attempts = policy.retry_attempts;
        retry_config.initial_delay = policy.retry_delay;
        retry_config.backoff_factor = policy.backoff_factor;
        retry_config.matched_faults = policy.matched_faults;
        RetryPolicy<R> retry{retry_config, policy.fallback_for<R>(), sink, policy.sleeper};
        op = retry.wrap(std::move(op), name);
    }
    else
    {
        ExceptionHandlerConfig handler_config;
        handler_config.error_message = policy.error_message;
        handler_config.log_level = policy.log_level;
        handler_config.matched_faults = policy.matched_faults;
        ExceptionHandler<R> handler{handler_config, policy.fallback_for<R>(), sink};
        op = handler.wrap(std::move(op), name);
    }

    if (policy.time_calls)
    {
        CallTimer timer{sink};
        op = timer.wrap(std::move(op), name);
    }

    return op;
}

} // namespace callguard
