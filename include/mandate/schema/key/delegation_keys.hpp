#pragma once

#include <mandate/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: delegation keys.
// Governance workflow: canonical key prefixes and key codecs for the
// delegation store, its secondary indexes, and the notification log.
namespace mandate::schema::key {

inline constexpr std::string_view kDelegationPrefix{"DELEGATION|"};
inline constexpr std::string_view kActiveDelegationPrefix{
    "DELEGATION|ACTIVE|"};
inline constexpr std::string_view kDelegationHistoryPrefix{
    "DELEGATION|HISTORY|"};
inline constexpr std::string_view kInboundDelegationPrefix{
    "DELEGATION|INBOUND|"};
inline constexpr std::string_view kDelegationIdPrefix{"DELEGATION|ID|"};
inline constexpr std::string_view kEventPrefix{"EVENT|"};
inline constexpr std::string_view kNextDelegationIdKey{
    "SYS|DELEGATION|NEXT_ID"};
inline constexpr std::string_view kNextEventIdKey{"SYS|EVENT|NEXT_ID"};

inline constexpr std::array<std::string_view, 5> kDelegationKeyspaces{
    kActiveDelegationPrefix, kDelegationHistoryPrefix,
    kInboundDelegationPrefix, kDelegationIdPrefix, kEventPrefix};

mandate::schema::bytes_t make_active_delegation_key(
    const mandate::schema::signer_id_t& delegator);

mandate::schema::bytes_t make_delegation_history_key(
    const mandate::schema::signer_id_t& delegator);

mandate::schema::bytes_t make_inbound_delegation_key(
    const mandate::schema::signer_id_t& delegate);

mandate::schema::bytes_t make_delegation_id_key(
    mandate::schema::delegation_id_t delegation_id);

mandate::schema::bytes_t make_event_key(uint64_t event_id);

mandate::schema::bytes_t make_system_key(std::string_view key);

}  // namespace mandate::schema::key
