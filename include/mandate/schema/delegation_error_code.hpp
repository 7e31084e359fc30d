#pragma once

#include <mandate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace mandate::schema {

/// Result codes carried by operation and resolution results. Zero is success.
enum class delegation_error_code : uint32_t {
  not_eligible = 1,
  self_delegation = 2,
  already_delegating = 3,
  would_create_cycle = 4,
  chain_too_long = 5,
  no_active_delegation = 6,
  unauthorized = 7,
  already_voted = 8,
  invalid_expiry = 9,
  delegation_cycle_detected = 10,
  delegation_missing = 11,
};

inline constexpr auto kDelegationErrorCodeMappings = std::array{
    std::pair<std::string_view, delegation_error_code>{
        "not eligible", delegation_error_code::not_eligible},
    std::pair<std::string_view, delegation_error_code>{
        "self delegation", delegation_error_code::self_delegation},
    std::pair<std::string_view, delegation_error_code>{
        "already delegating", delegation_error_code::already_delegating},
    std::pair<std::string_view, delegation_error_code>{
        "would create cycle", delegation_error_code::would_create_cycle},
    std::pair<std::string_view, delegation_error_code>{
        "chain too long", delegation_error_code::chain_too_long},
    std::pair<std::string_view, delegation_error_code>{
        "no active delegation", delegation_error_code::no_active_delegation},
    std::pair<std::string_view, delegation_error_code>{
        "unauthorized", delegation_error_code::unauthorized},
    std::pair<std::string_view, delegation_error_code>{
        "already voted", delegation_error_code::already_voted},
    std::pair<std::string_view, delegation_error_code>{
        "invalid expiry", delegation_error_code::invalid_expiry},
    std::pair<std::string_view, delegation_error_code>{
        "delegation cycle detected",
        delegation_error_code::delegation_cycle_detected},
    std::pair<std::string_view, delegation_error_code>{
        "delegation missing", delegation_error_code::delegation_missing}};

inline constexpr std::string_view to_string(const delegation_error_code value) {
  return to_string(value, kDelegationErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const delegation_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace mandate::schema
