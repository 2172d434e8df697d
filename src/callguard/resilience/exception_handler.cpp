#include "callguard/resilience/exception_handler.hpp"

namespace callguard
{

std::string handled_fault_message(const ExceptionHandlerConfig& config,
                                  const std::string& label,
                                  const std::exception_ptr& fault,
                                  const std::string& fallback)
{
    std::string message = fmt::format("call to '{}' failed - {}: {}",
                                      label, fault_kind(fault), fault_message(fault));
    if (!config.error_message.empty())
    {
        message = config.error_message + ": " + message;
    }
    if (config.reraise)
    {
        message += ", rethrowing";
    }
    else
    {
        message += ", returning fallback " + fallback;
    }
    return message;
}

} // namespace callguard
