#include "callguard/decoration/capability_enumerator.hpp"

namespace callguard
{

bool is_private_name(std::string_view name) noexcept
{
    return !name.empty() && name.front() == '_';
}

std::vector<CapabilityDescriptor> list_capabilities(const CapabilityTable& table)
{
    // entries() is already in name order.
    std::vector<CapabilityDescriptor> result;
    for (auto& desc : table.entries())
    {
        if (desc.kind == CapabilityKind::Property || is_private_name(desc.name))
        {
            continue;
        }
        result.push_back(std::move(desc));
    }
    return result;
}

std::vector<CapabilityDescriptor> list_capabilities(const ICapabilityProvider& target)
{
    return list_capabilities(target.capabilities());
}

} // namespace callguard
