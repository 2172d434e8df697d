/**
 * @file auto_decoration_engine.hpp
 * @brief AutoDecorationEngine: apply one DecorationPolicy to every public
 *        capability of a target.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/common/log_sink.hpp"
#include "callguard/decoration/capability_host.hpp"
#include "callguard/decoration/decoration_policy.hpp"

namespace callguard
{

/**
 * @brief What one wrap() call did, by capability name.
 */
struct WrapReport
{
    /// Capabilities now bound to a decorated operation.
    std::vector<std::string> decorated;

    /// Subset of `decorated` whose previous decoration was replaced.
    std::vector<std::string> replaced;

    /// Capabilities the policy filter rejected or that refused rebinding.
    std::vector<std::string> skipped;
};

/**
 * @brief Rebinds the public capabilities of a target to decorated forms.
 *
 * @details
 * Capabilities are found with list_capabilities(), so private names and
 * properties are never touched. Wrapping is idempotent: each decoration is
 * built from the capability's original operation, and wrapping again replaces
 * the previous decoration.
 *
 * A capability that cannot be rebound (read-only, or a policy that cannot be
 * built for it) is logged at warning and skipped; the rest are still wrapped.
 *
 * @par Thread Safety
 * - The engine itself is immutable. wrap() and unwrap() must not race with
 *   invocations of the same target.
 */
class AutoDecorationEngine
{
public:
    /**
     * @param sink Receives the engine's own log entries; nullptr uses the
     *        default sink. Decorator entries go to DecorationPolicy::sink.
     */
    explicit AutoDecorationEngine(LogSinkPtr sink = {});

    WrapReport wrap(CapabilityTable& table, const DecorationPolicy& policy) const;

    WrapReport wrap(ICapabilityProvider& target, const DecorationPolicy& policy) const
    {
        return wrap(target.capabilities(), policy);
    }

    /**
     * @brief Restore every public capability to its original operation.
     * @return Number of capabilities that were decorated.
     */
    std::size_t unwrap(CapabilityTable& table) const;

    std::size_t unwrap(ICapabilityProvider& target) const
    {
        return unwrap(target.capabilities());
    }

private:
    LogSinkPtr m_sink;
};

} // namespace callguard
