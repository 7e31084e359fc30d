#pragma once

#include <mandate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: end reason.
// Governance workflow: why an active delegation left its slot.
namespace mandate::schema {

enum class end_reason_t : uint8_t { revoked = 0, expired = 1 };

inline constexpr auto kEndReasonMappings = std::array{
    std::pair<std::string_view, end_reason_t>{"revoked", end_reason_t::revoked},
    std::pair<std::string_view, end_reason_t>{"expired",
                                              end_reason_t::expired}};

template <>
inline std::optional<end_reason_t> try_from_string<end_reason_t>(
    const std::string_view value) {
  return from_string(value, kEndReasonMappings);
}

inline constexpr std::string_view to_string(const end_reason_t value) {
  return to_string(value, kEndReasonMappings).value_or("unknown");
}

}  // namespace mandate::schema
