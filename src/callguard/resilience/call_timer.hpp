/**
 * @file call_timer.hpp
 * @brief CallTimer: log how long each call takes.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/clock.hpp"
#include "callguard/common/log_sink.hpp"

namespace callguard
{

namespace detail
{

void log_call_started(ILogSink& sink, const std::string& label);
void log_call_finished(ILogSink& sink, const std::string& label,
                       std::chrono::nanoseconds elapsed, bool faulted);

} // namespace detail

/**
 * @brief Decorator that logs the start and duration of every call at info level.
 *
 * @details
 * Faults propagate unchanged; the duration is logged either way.
 */
class CallTimer
{
public:
    explicit CallTimer(LogSinkPtr sink = {}, const IClock* clock = nullptr)
        : m_sink{resolve_sink(std::move(sink))}
        , m_clock{clock ? clock : &default_clock()}
    {}

    template <typename F, typename... Args>
    decltype(auto) run_labeled(const std::string& label, F& fn, Args&&... args) const
    {
        detail::log_call_started(*m_sink, label);
        auto start = m_clock->now();
        bool faulted = true;
        struct Finish
        {
            const CallTimer& timer;
            const std::string& label;
            IClock::time_point start;
            const bool& faulted;

            ~Finish()
            {
                detail::log_call_finished(*timer.m_sink, label, timer.m_clock->now() - start, faulted);
            }
        } finish{*this, label, start, faulted};

        if constexpr (std::is_void_v<std::invoke_result_t<F&, Args...>>)
        {
            std::invoke(fn, std::forward<Args>(args)...);
            faulted = false;
        }
        else
        {
            auto result = std::invoke(fn, std::forward<Args>(args)...);
            faulted = false;
            return result;
        }
    }

    template <typename F, typename... Args>
    decltype(auto) run(F&& fn, Args&&... args) const
    {
        return run_labeled("callable", fn, std::forward<Args>(args)...);
    }

    template <typename F>
    auto wrap(F fn, std::string label = "callable") const
    {
        return [timer = *this, fn = std::move(fn), label = std::move(label)](auto&&... args) mutable -> decltype(auto) {
            return timer.run_labeled(label, fn, std::forward<decltype(args)>(args)...);
        };
    }

private:
    LogSinkPtr m_sink;
    const IClock* m_clock;
};

} // namespace callguard
