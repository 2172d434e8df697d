#include "callguard/decoration/auto_decoration_engine.hpp"
#include "callguard/common/callguard_errors.hpp"
#include "callguard/decoration/capability_enumerator.hpp"
#include <fmt/format.h>

namespace callguard
{

AutoDecorationEngine::AutoDecorationEngine(LogSinkPtr sink)
    : m_sink{resolve_sink(std::move(sink))}
{
}

WrapReport AutoDecorationEngine::wrap(CapabilityTable& table, const DecorationPolicy& policy) const
{
    WrapReport report;
    for (const auto& desc : list_capabilities(table))
    {
        if (!policy.accepts(desc.name))
        {
            report.skipped.push_back(desc.name);
            continue;
        }

        try
        {
            const bool replaced = table.decorate(desc.name, policy);
            report.decorated.push_back(desc.name);
            if (replaced)
            {
                report.replaced.push_back(desc.name);
                m_sink->log(LogLevel::Debug,
                            fmt::format("capability '{}' was already decorated; rebuilt from original",
                                        desc.name));
            }
        }
        catch (const CallGuardError& e)
        {
            m_sink->log(LogLevel::Warn,
                        fmt::format("could not decorate capability '{}' ({}): {}",
                                    desc.name, to_string(e.code()), e.what()));
            report.skipped.push_back(desc.name);
        }
    }

    m_sink->log(LogLevel::Debug,
                fmt::format("decorated {} capabilities, skipped {}",
                            report.decorated.size(), report.skipped.size()));
    return report;
}

std::size_t AutoDecorationEngine::unwrap(CapabilityTable& table) const
{
    std::size_t restored = 0;
    for (const auto& desc : list_capabilities(table))
    {
        if (desc.decorated)
        {
            table.restore(desc.name);
            ++restored;
        }
    }
    m_sink->log(LogLevel::Debug, fmt::format("restored {} capabilities", restored));
    return restored;
}

} // namespace callguard
