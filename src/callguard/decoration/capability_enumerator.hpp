/**
 * @file capability_enumerator.hpp
 * @brief List the public operations of a capability provider.
 */
#pragma once
#include "callguard/common/common.hpp"
#include "callguard/decoration/capability_host.hpp"

namespace callguard
{

/**
 * @brief Whether @p name is private by convention (leading underscore).
 */
[[nodiscard]] bool is_private_name(std::string_view name) noexcept;

/**
 * @brief Public operations of @p table, sorted by name.
 *
 * @details
 * Private names and properties are left out. The order is stable across calls.
 */
[[nodiscard]] std::vector<CapabilityDescriptor> list_capabilities(const CapabilityTable& table);

[[nodiscard]] std::vector<CapabilityDescriptor> list_capabilities(const ICapabilityProvider& target);

} // namespace callguard
