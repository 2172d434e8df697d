#include "callguard/resilience/fault_locator.hpp"
#include <boost/core/demangle.hpp>
#include <fmt/format.h>

namespace callguard
{

namespace
{

std::string describe_frame(const boost::stacktrace::frame& frame)
{
    std::string file = frame.source_file();
    std::string name = frame.name();
    if (file.empty())
    {
        file = "??";
    }
    if (name.empty())
    {
        name = fmt::format("{}", frame.address());
    }
    return fmt::format("{}:{} in {}", file, frame.source_line(), name);
}

const TracedFault* as_traced(const std::exception& fault) noexcept
{
    return dynamic_cast<const TracedFault*>(&fault);
}

} // namespace

StackTrace capture_stack_trace(std::size_t skip)
{
    // Skip this function's own frame.
    return StackTrace(skip + 1, static_cast<std::size_t>(-1));
}

std::string fault_kind(const std::exception& fault)
{
    if (const auto* traced = as_traced(fault))
    {
        return boost::core::demangle(traced->origin_type().name());
    }
    return boost::core::demangle(typeid(fault).name());
}

std::string fault_kind(std::exception_ptr fault)
{
    if (!fault)
    {
        return {};
    }
    try
    {
        std::rethrow_exception(fault);
    }
    catch (const std::exception& e)
    {
        return fault_kind(e);
    }
    catch (...)
    {
        return "unknown";
    }
}

std::string fault_message(std::exception_ptr fault)
{
    if (!fault)
    {
        return {};
    }
    try
    {
        std::rethrow_exception(fault);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return {};
    }
}

FaultLocation locate(const std::exception& fault, std::size_t skip_frames) noexcept
{
    FaultLocation result;
    try
    {
        result.location = kUnknownLocation;
        result.trace = fmt::format("{}: {}\n", fault_kind(fault), fault.what());

        const auto* traced = as_traced(fault);
        if (!traced || traced->stack_trace().empty())
        {
            return result;
        }

        const auto& frames = traced->stack_trace().as_vector();
        if (skip_frames < frames.size())
        {
            result.location = describe_frame(frames[skip_frames]);
        }
        for (std::size_t i = 0; i < frames.size(); ++i)
        {
            result.trace += fmt::format("  #{} {}\n", i, describe_frame(frames[i]));
        }
    }
    catch (const std::exception&)
    {
        // Rendering ran out of memory; keep whatever was produced.
        if (result.location.empty())
        {
            result.location = kUnknownLocation;
        }
    }
    return result;
}

FaultLocation locate(std::exception_ptr fault, std::size_t skip_frames) noexcept
{
    if (!fault)
    {
        return FaultLocation{kUnknownLocation, {}};
    }
    try
    {
        std::rethrow_exception(fault);
    }
    catch (const std::exception& e)
    {
        return locate(e, skip_frames);
    }
    catch (...)
    {
        return FaultLocation{kUnknownLocation, "unknown: non-standard exception\n"};
    }
}

} // namespace callguard
