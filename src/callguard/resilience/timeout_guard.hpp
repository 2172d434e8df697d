/**
 * @file timeout_guard.hpp
 * @brief TimeoutGuard: bound the caller's wait for a callable.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/log_sink.hpp"
#include "callguard/resilience/describe_value.hpp"
#include "callguard/resilience/settlement.hpp"
#include <algorithm>
#include <tuple>

namespace callguard
{

/**
 * @brief Configuration for TimeoutGuard.
 */
struct TimeoutConfig
{
    /**
     * @brief Longest the caller waits for the worker.
     */
    std::chrono::milliseconds limit{1000};

    /**
     * @brief Granularity of the caller's wait. Clamped to (0, 500ms].
     */
    std::chrono::milliseconds poll_slice{500};
};

/**
 * @brief Upper bound of TimeoutConfig::poll_slice.
 */
inline constexpr std::chrono::milliseconds kMaxPollSlice{500};

/**
 * @brief Check a TimeoutConfig.
 * @throws CallGuardError (InvalidPolicy) on a negative limit or slice.
 */
void validate(const TimeoutConfig& config);

/**
 * @brief How a guarded call ended, from the caller's point of view.
 */
enum class TimedStatus
{
    Completed,  ///< The worker returned within the limit.
    Faulted,    ///< The worker raised a fault within the limit.
    TimedOut    ///< The limit elapsed first; the worker was abandoned.
};

const char* to_string(TimedStatus status) noexcept;

namespace detail
{

/**
 * @brief Completion flag shared between a worker thread and its observers.
 */
struct WorkerSignal
{
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done{false};
    bool abandoned{false};
};

/**
 * @brief WorkerSignal plus the worker's late result.
 */
template <typename T>
struct WorkerState : WorkerSignal
{
    std::optional<T> value;
    std::exception_ptr fault{};
};

void log_worker_fault(ILogSink& sink, const std::string& label,
                      const std::exception_ptr& fault, bool abandoned);

void log_timed_out(ILogSink& sink, const std::string& label,
                   std::chrono::milliseconds limit, const std::string& fallback);

[[noreturn]] void throw_timeout_exceeded(const std::string& label, std::chrono::milliseconds limit);

std::chrono::milliseconds effective_poll_slice(const TimeoutConfig& config) noexcept;

} // namespace detail

/**
 * @brief Collection of workers abandoned by one or more TimeoutGuards.
 *
 * @details
 * A guard constructed with a collector hands every worker it abandons to it,
 * so the owner of whatever those workers touch can wait for them before
 * releasing it. Finished workers are pruned as new ones arrive.
 *
 * @par Thread Safety
 * - All members may be called concurrently.
 */
class AbandonedWorkers
{
public:
    AbandonedWorkers() = default;
    AbandonedWorkers(const AbandonedWorkers&) = delete;
    AbandonedWorkers& operator=(const AbandonedWorkers&) = delete;

    void adopt(std::shared_ptr<detail::WorkerSignal> worker);

    /**
     * @brief Number of adopted workers that are still running.
     */
    [[nodiscard]] std::size_t pending() const;

    /**
     * @brief Block until every adopted worker has finished.
     */
    void wait_all();

private:
    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<detail::WorkerSignal>> m_workers;
};

using AbandonedWorkersPtr = std::shared_ptr<AbandonedWorkers>;

/**
 * @brief Handle to a worker that outlived its deadline.
 *
 * @details
 * The worker is never cancelled. The handle lets a caller wait for it,
 * collect its late result, or drop the handle and ignore it. Dropping the
 * handle does not block.
 *
 * @par Thread Safety
 * - All members may be called concurrently with the running worker.
 */
template <typename T>
class OrphanedTask
{
public:
    OrphanedTask() = default;

    explicit OrphanedTask(std::shared_ptr<detail::WorkerState<T>> state)
        : m_state{std::move(state)}
    {}

    /**
     * @brief Whether this handle refers to a worker.
     */
    [[nodiscard]] bool valid() const noexcept
    {
        return m_state != nullptr;
    }

    /**
     * @brief Whether the worker has finished.
     * @return false for an invalid handle.
     */
    [[nodiscard]] bool finished() const
    {
        if (!m_state)
        {
            return false;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->done;
    }

    /**
     * @brief Block until the worker finishes.
     */
    void wait() const
    {
        if (!m_state)
        {
            return;
        }
        std::unique_lock<std::mutex> lock(m_state->mutex);
        m_state->done_cv.wait(lock, [this] { return m_state->done; });
    }

    /**
     * @brief Block until the worker finishes or @p timeout elapses.
     * @return true if the worker has finished.
     */
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const
    {
        if (!m_state)
        {
            return false;
        }
        std::unique_lock<std::mutex> lock(m_state->mutex);
        return m_state->done_cv.wait_for(lock, timeout, [this] { return m_state->done; });
    }

    /**
     * @brief Move out the late value, if the worker finished with one.
     */
    std::optional<T> take_value()
    {
        if (!m_state)
        {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return std::exchange(m_state->value, std::nullopt);
    }

    /**
     * @brief The worker's fault, if it finished with one.
     */
    [[nodiscard]] std::exception_ptr fault() const
    {
        if (!m_state)
        {
            return nullptr;
        }
        std::lock_guard<std::mutex> lock(m_state->mutex);
        return m_state->fault;
    }

private:
    std::shared_ptr<detail::WorkerState<T>> m_state;
};

/**
 * @brief What launch() observed within the limit.
 */
template <typename T>
struct TimedResult
{
    TimedStatus status{TimedStatus::Completed};

    /// Set when status is Completed.
    std::optional<T> value;

    /// Set when status is Faulted.
    std::exception_ptr fault{};

    /// Valid when status is TimedOut.
    OrphanedTask<T> orphan;

    [[nodiscard]] bool timed_out() const noexcept
    {
        return status == TimedStatus::TimedOut;
    }
};

/**
 * @brief Decorator that runs a callable on a worker thread under a deadline.
 *
 * @details
 * Each call starts one detached worker thread; the process may exit without
 * waiting for it. The caller waits in slices of at most 500ms until the
 * worker finishes or the cumulative wait reaches the limit.
 *
 * - Worker finished: its value is returned. A worker fault returns the
 *   fallback if one is set and is rethrown unchanged otherwise.
 * - Limit reached: a warning is logged and the fallback is returned. The worker
 *   keeps running and its result is discarded. Without a fallback, `void`
 *   callables return normally and others throw CallGuardError
 *   (TimeoutExceeded).
 *
 * Arguments are copied into the worker, which may outlive the caller's
 * frame. Callables must be copy- or move-constructible. When the callable
 * refers to an object the caller may destroy, pass an AbandonedWorkers
 * collector and wait on it before the object goes away.
 *
 * @tparam R Return type of the decorated callables.
 *
 * @par Thread Safety
 * - Immutable after construction; run() may be called concurrently.
 */
template <typename R>
class TimeoutGuard
{
    static_assert(!std::is_reference_v<R>, "TimeoutGuard: reference results are not supported");

public:
    using value_type = value_t<R>;

    /**
     * @throws CallGuardError (InvalidPolicy) if @p config is invalid.
     */
    explicit TimeoutGuard(
        TimeoutConfig config = {},
        Fallback<R> fallback = std::nullopt,
        LogSinkPtr sink = {},
        AbandonedWorkersPtr abandoned = {})
        : m_config{config}
        , m_fallback{std::move(fallback)}
        , m_sink{resolve_sink(std::move(sink))}
        , m_abandoned{std::move(abandoned)}
    {
        validate(m_config);
    }

    const TimeoutConfig& config() const noexcept
    {
        return m_config;
    }

    const Fallback<R>& fallback() const noexcept
    {
        return m_fallback;
    }

    /**
     * @brief Start @p fn on a worker and wait for it up to the limit.
     * @throws std::system_error if the worker thread cannot be started.
     */
    template <typename F, typename... Args>
    TimedResult<value_type> launch_labeled(const std::string& label, F fn, Args... args) const
    {
        auto state = std::make_shared<detail::WorkerState<value_type>>();

        std::thread worker(
            [state, sink = m_sink, label, fn = std::move(fn),
             packed = std::make_tuple(std::move(args)...)]() mutable {
                std::optional<value_type> value;
                std::exception_ptr fault;
                try
                {
                    value.emplace(std::apply(
                        [&fn](auto&... unpacked) { return invoke_for_value(fn, unpacked...); },
                        packed));
                }
                catch (...)
                {
                    fault = std::current_exception();
                }

                bool abandoned = false;
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->value = std::move(value);
                    state->fault = fault;
                    state->done = true;
                    abandoned = state->abandoned;
                }
                state->done_cv.notify_all();

                // Faults observed by the caller are logged on the caller's side.
                if (fault && abandoned)
                {
                    detail::log_worker_fault(*sink, label, fault, true);
                }
            });
        worker.detach();

        TimedResult<value_type> result;
        const auto slice = detail::effective_poll_slice(m_config);
        const auto deadline = std::chrono::steady_clock::now() + m_config.limit;

        std::unique_lock<std::mutex> lock(state->mutex);
        while (!state->done)
        {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                break;
            }
            auto wake = std::min<std::chrono::steady_clock::time_point>(now + slice, deadline);
            state->done_cv.wait_until(lock, wake, [&state] { return state->done; });
        }

        if (state->done)
        {
            if (state->fault)
            {
                result.status = TimedStatus::Faulted;
                result.fault = state->fault;
                lock.unlock();
                detail::log_worker_fault(*m_sink, label, result.fault, false);
            }
            else
            {
                result.status = TimedStatus::Completed;
                result.value = std::move(state->value);
            }
            return result;
        }

        state->abandoned = true;
        lock.unlock();
        if (m_abandoned)
        {
            m_abandoned->adopt(state);
        }

        detail::log_timed_out(*m_sink, label, m_config.limit, detail::describe_fallback(m_fallback));
        result.status = TimedStatus::TimedOut;
        result.orphan = OrphanedTask<value_type>{state};
        return result;
    }

    template <typename F, typename... Args>
    TimedResult<value_type> launch(F fn, Args... args) const
    {
        return launch_labeled("callable", std::move(fn), std::move(args)...);
    }

    template <typename F, typename... Args>
    R run_labeled(const std::string& label, F fn, Args... args) const
    {
        return resolve<R>(settle(launch_labeled(label, std::move(fn), std::move(args)...), label));
    }

    template <typename F, typename... Args>
    R run(F fn, Args... args) const
    {
        return run_labeled("callable", std::move(fn), std::move(args)...);
    }

    template <typename F>
    auto wrap(F fn, std::string label = "callable") const
    {
        return [guard = *this, fn = std::move(fn), label = std::move(label)](auto&&... args) -> R {
            return guard.run_labeled(label, fn, std::forward<decltype(args)>(args)...);
        };
    }

private:
    Settlement<value_type> settle(TimedResult<value_type> timed, const std::string& label) const
    {
        switch (timed.status)
        {
            case TimedStatus::Completed:
                return Recovered<value_type>{std::move(*timed.value), false};

            case TimedStatus::Faulted:
                if (m_fallback)
                {
                    return Recovered<value_type>{*m_fallback, true};
                }
                return Propagated{timed.fault};

            case TimedStatus::TimedOut:
                break;
        }

        if (m_fallback)
        {
            return Recovered<value_type>{*m_fallback, true};
        }
        if constexpr (std::is_void_v<R>)
        {
            return Recovered<value_type>{std::monostate{}, true};
        }
        else
        {
            detail::throw_timeout_exceeded(label, m_config.limit);
        }
    }

    TimeoutConfig m_config;
    Fallback<R> m_fallback;
    LogSinkPtr m_sink;
    AbandonedWorkersPtr m_abandoned;
};

} // namespace callguard
