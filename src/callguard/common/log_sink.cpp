#include "callguard/common/log_sink.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace callguard
{

const char* to_string(LogLevel level) noexcept
{
    switch (level)
    {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug")
    {
        return LogLevel::Debug;
    }
    if (lowered == "info")
    {
        return LogLevel::Info;
    }
    if (lowered == "warn" || lowered == "warning")
    {
        return LogLevel::Warn;
    }
    if (lowered == "error" || lowered == "exception")
    {
        return LogLevel::Error;
    }
    return std::nullopt;
}

StreamLogSink::StreamLogSink(std::ostream& out, LoggingConfig config)
    : m_out{out}
    , m_config{config}
{}

void StreamLogSink::log(LogLevel level, std::string_view message) noexcept
{
    if (level < m_config.min_level)
    {
        return;
    }
    try
    {
        std::string line;
        if (m_config.show_timestamp)
        {
            auto now = std::chrono::system_clock::now();
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;
            line = fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d} | {:<5} | {}\n",
                               fmt::localtime(std::chrono::system_clock::to_time_t(now)),
                               static_cast<int>(ms.count()),
                               to_string(level),
                               message);
        }
        else
        {
            line = fmt::format("{:<5} | {}\n", to_string(level), message);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_out << line << std::flush;
    }
    catch (const std::exception&)
    {
        // Formatting or stream failure: the record is lost.
    }
}

namespace
{

struct DefaultSinkSlot
{
    std::mutex mutex;
    LogSinkPtr sink{std::make_shared<StreamLogSink>()};
};

DefaultSinkSlot& default_sink_slot()
{
    static DefaultSinkSlot slot;
    return slot;
}

} // namespace

LogSinkPtr default_log_sink()
{
    auto& slot = default_sink_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.sink;
}

LogSinkPtr set_default_log_sink(LogSinkPtr sink)
{
    if (!sink)
    {
        sink = std::make_shared<NullLogSink>();
    }
    auto& slot = default_sink_slot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    std::swap(slot.sink, sink);
    return sink;
}

} // namespace callguard
