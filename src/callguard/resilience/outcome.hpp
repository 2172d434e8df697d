/**
 * @file outcome.hpp
 * @brief Outcome: the record produced by executing a callable once.
 * @see outcome.inline.hpp for execute() and the templated members.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/any_value.hpp"
#include "callguard/common/clock.hpp"
#include "callguard/common/log_sink.hpp"
#include "callguard/resilience/settlement.hpp"
#include <iosfwd>

namespace callguard
{

namespace detail
{
struct OutcomeAccess;
} // namespace detail

/**
 * @brief Description of the fault that ended an execution.
 */
struct FaultInfo
{
    /// Demangled type name of the fault.
    std::string kind;

    /// The fault's what() text.
    std::string message;

    /// Originating frame, or "unknown location".
    std::string location;

    /// Full rendered trace.
    std::string trace;
};

/**
 * @brief Flattened summary of an outcome, for reports and logging.
 */
struct OutcomeInfo
{
    bool success{true};
    double elapsed_ms{0.0};
    IClock::time_point started_at{};
    IClock::time_point ended_at{};
    std::vector<std::string> metadata_keys;
    std::optional<std::string> error;
    std::optional<std::string> error_kind;
};

/**
 * @brief Options for execute_with().
 */
struct ExecuteOptions
{
    /**
     * @brief Name of the callable, used in the error log entry.
     */
    std::string label{"callable"};

    /**
     * @brief Clock for start/end instants; nullptr uses default_clock().
     */
    const IClock* clock{nullptr};

    /**
     * @brief Sink for the error entry; nullptr uses default_log_sink().
     */
    LogSinkPtr sink{};
};

/**
 * @brief The part of an outcome that does not depend on the value type.
 *
 * @par Invariants
 * - `has_fault()` if and only if `!succeeded()`.
 * - `elapsed()` is zero only for an outcome that was never measured.
 *
 * @par Thread Safety
 * - Not synchronized. Safe for concurrent reads once built.
 */
class OutcomeBase
{
public:
    /**
     * @brief Smallest elapsed time recorded for a measured execution.
     */
    static constexpr std::chrono::nanoseconds kMinElapsed{std::chrono::microseconds{1}};

    virtual ~OutcomeBase() = default;

    [[nodiscard]] bool succeeded() const noexcept
    {
        return m_succeeded;
    }

    [[nodiscard]] bool has_fault() const noexcept
    {
        return m_fault.has_value();
    }

    [[nodiscard]] const std::optional<FaultInfo>& fault() const noexcept
    {
        return m_fault;
    }

    /**
     * @brief The fault's message, or std::nullopt when there is no fault.
     */
    [[nodiscard]] std::optional<std::string> fault_message() const;

    /**
     * @brief The fault's kind name, or std::nullopt when there is no fault.
     */
    [[nodiscard]] std::optional<std::string> fault_kind() const;

    /**
     * @brief The captured fault, or nullptr.
     */
    [[nodiscard]] std::exception_ptr exception() const noexcept
    {
        return m_exception;
    }

    /**
     * @brief Rethrow the captured fault unchanged, if any.
     */
    void rethrow_if_fault() const;

    [[nodiscard]] IClock::time_point started_at() const noexcept
    {
        return m_started_at;
    }

    [[nodiscard]] IClock::time_point ended_at() const noexcept
    {
        return m_ended_at;
    }

    [[nodiscard]] std::chrono::nanoseconds elapsed() const noexcept
    {
        return m_elapsed;
    }

    /**
     * @brief Store a metadata entry, replacing any previous value for @p key.
     */
    template <typename T>
    void put(std::string key, T&& value);

    /**
     * @brief Read a metadata entry.
     * @return The stored value, or @p fallback if absent or of another type.
     */
    template <typename T>
    [[nodiscard]] T get(const std::string& key, T fallback) const;

    [[nodiscard]] bool has_metadata(const std::string& key) const
    {
        return m_metadata.count(key) != 0;
    }

    [[nodiscard]] const std::map<std::string, AnyValue>& metadata() const noexcept
    {
        return m_metadata;
    }

    [[nodiscard]] OutcomeInfo info() const;

    /**
     * @brief One-line description for logging.
     * @details Names the result on success and the fault on failure.
     */
    [[nodiscard]] std::string summary() const;

protected:
    OutcomeBase() = default;
    OutcomeBase(const OutcomeBase&) = default;
    OutcomeBase(OutcomeBase&&) = default;
    OutcomeBase& operator=(const OutcomeBase&) = default;
    OutcomeBase& operator=(OutcomeBase&&) = default;

    /**
     * @brief Rendered result for summary(); std::nullopt when there is none.
     */
    virtual std::optional<std::string> describe_result() const
    {
        return std::nullopt;
    }

    friend struct detail::OutcomeAccess;

    void record_timing(IClock::time_point start, IClock::time_point end) noexcept;
    void record_fault(std::exception_ptr fault, const std::string& label, ILogSink& sink);
    void clear_shared_state(ILogSink& sink) noexcept;

    bool m_succeeded{true};

private:
    std::optional<FaultInfo> m_fault;
    std::exception_ptr m_exception{};
    IClock::time_point m_started_at{};
    IClock::time_point m_ended_at{};
    std::chrono::nanoseconds m_elapsed{0};
    std::map<std::string, AnyValue> m_metadata;
};

std::ostream& operator<<(std::ostream& os, const OutcomeBase& outcome);

/**
 * @brief Outcome of one execution of a callable returning T.
 *
 * @details
 * Produced by execute(). Holds the value on success, the fault on failure,
 * the start/end instants and free-form metadata.
 *
 * Comparison and truthiness delegate to the value, so call sites can treat an
 * outcome like its payload:
 * - `outcome == 8` compares the value (false when there is none).
 * - `if (outcome)` tests the value: bool-convertible values by conversion,
 *   strings and containers by non-emptiness, std::monostate and missing
 *   values are false, anything else is true.
 *
 * @tparam T The value type (value_t of the callable's return type).
 */
template <typename T>
class Outcome : public OutcomeBase
{
public:
    using value_type = T;

    /**
     * @brief An unmeasured, successful outcome without a value.
     */
    Outcome() = default;

    [[nodiscard]] const std::optional<T>& value() const noexcept
    {
        return m_value;
    }

    /**
     * @brief The value, or @p fallback if the execution did not succeed.
     */
    [[nodiscard]] T value_or(T fallback) const;

    /**
     * @brief The value.
     * @throws std::bad_optional_access if there is none.
     */
    [[nodiscard]] const T& content() const
    {
        return m_value.value();
    }

    /**
     * @brief Drop the value, the fault and all metadata.
     * @details succeeded() and timing are kept. Idempotent.
     */
    void clear(LogSinkPtr sink = {});

    explicit operator bool() const;

protected:
    std::optional<std::string> describe_result() const override;

private:
    friend struct detail::OutcomeAccess;

    std::optional<T> m_value;
};

template <typename T>
bool operator==(const Outcome<T>& lhs, const Outcome<T>& rhs)
{
    return lhs.value() == rhs.value();
}

template <typename T>
bool operator!=(const Outcome<T>& lhs, const Outcome<T>& rhs)
{
    return !(lhs == rhs);
}

template <typename T, typename U,
          typename = std::enable_if_t<!std::is_base_of_v<OutcomeBase, U>>>
bool operator==(const Outcome<T>& lhs, const U& rhs)
{
    return lhs.value().has_value() && *lhs.value() == rhs;
}

template <typename T, typename U,
          typename = std::enable_if_t<!std::is_base_of_v<OutcomeBase, U>>>
bool operator!=(const Outcome<T>& lhs, const U& rhs)
{
    return !(lhs == rhs);
}

/**
 * @brief Run @p fn once and record what happened.
 *
 * @details
 * Faults never escape: they are recorded in the outcome and logged once at
 * error level with their location and trace.
 */
template <typename F, typename... Args>
auto execute_with(const ExecuteOptions& options, F&& fn, Args&&... args)
    -> Outcome<value_t<std::invoke_result_t<F&, Args...>>>;

/**
 * @brief execute_with() using the default clock, sink and label.
 */
template <typename F, typename... Args>
auto execute(F&& fn, Args&&... args)
    -> Outcome<value_t<std::invoke_result_t<F&, Args...>>>;

} // namespace callguard
