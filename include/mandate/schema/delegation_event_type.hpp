#pragma once

#include <mandate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: delegation event type.
// Governance workflow: notification taxonomy published to off-chain
// observers.
namespace mandate::schema {

enum class delegation_event_type_t : uint8_t {
  created = 0,
  revoked = 1,
  expired = 2,
};

inline constexpr auto kDelegationEventTypeMappings =
    std::array{std::pair<std::string_view, delegation_event_type_t>{
                   "delegation_created", delegation_event_type_t::created},
               std::pair<std::string_view, delegation_event_type_t>{
                   "delegation_revoked", delegation_event_type_t::revoked},
               std::pair<std::string_view, delegation_event_type_t>{
                   "delegation_expired", delegation_event_type_t::expired}};

template <>
inline std::optional<delegation_event_type_t>
try_from_string<delegation_event_type_t>(const std::string_view value) {
  return from_string(value, kDelegationEventTypeMappings);
}

inline constexpr std::string_view to_string(
    const delegation_event_type_t value) {
  return to_string(value, kDelegationEventTypeMappings).value_or("unknown");
}

}  // namespace mandate::schema
