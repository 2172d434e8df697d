/**
 * @file log_sink.hpp
 * @brief Logging capability consumed by every decorator.
 */
#pragma once
#include "callguard/common/common.hpp"

namespace callguard
{

/**
 * @brief Severity of a log record.
 */
enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

/**
 * @brief Upper-case name of a level ("DEBUG", "INFO", "WARN", "ERROR").
 */
const char* to_string(LogLevel level) noexcept;

/**
 * @brief Parse a level name, case-insensitively.
 *
 * @details
 * Accepts "debug", "info", "warn", "warning", "error" and "exception"
 * ("exception" maps to Error).
 *
 * @return The level, or std::nullopt if the name is not recognized.
 */
std::optional<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Interface for log sinks.
 *
 * @par Contract
 * - log() is called synchronously from the thread that produced the record.
 * - log() never throws.
 * - Implementations must be safe to call from multiple threads.
 */
class ILogSink
{
public:
    virtual ~ILogSink() = default;

    virtual void log(LogLevel level, std::string_view message) noexcept = 0;
};

using LogSinkPtr = std::shared_ptr<ILogSink>;

/**
 * @brief Configuration for StreamLogSink.
 */
struct LoggingConfig
{
    /**
     * @brief Records below this level are dropped.
     */
    LogLevel min_level{LogLevel::Debug};

    /**
     * @brief Whether to prefix each line with a wall-clock timestamp.
     */
    bool show_timestamp{true};
};

/**
 * @brief Log sink writing one formatted line per record to an ostream.
 *
 * @details
 * Line format: `2025-01-31 12:00:00.123 | WARN  | message`.
 * Writes are serialized by an internal mutex.
 */
class StreamLogSink : public ILogSink
{
public:
    explicit StreamLogSink(std::ostream& out = std::clog, LoggingConfig config = {});

    void log(LogLevel level, std::string_view message) noexcept override;

    const LoggingConfig& config() const noexcept
    {
        return m_config;
    }

private:
    std::ostream& m_out;
    LoggingConfig m_config;
    std::mutex m_mutex;
};

/**
 * @brief Log sink that drops every record.
 */
class NullLogSink : public ILogSink
{
public:
    void log(LogLevel, std::string_view) noexcept override
    {}
};

/**
 * @brief Get the process default sink.
 * @details Initially a StreamLogSink on std::clog.
 */
LogSinkPtr default_log_sink();

/**
 * @brief Replace the process default sink.
 * @param sink New sink; nullptr installs a NullLogSink.
 * @return The previously installed sink.
 */
LogSinkPtr set_default_log_sink(LogSinkPtr sink);

/**
 * @brief Return @p sink if non-null, else the process default sink.
 */
inline LogSinkPtr resolve_sink(LogSinkPtr sink)
{
    return sink ? std::move(sink) : default_log_sink();
}

} // namespace callguard
