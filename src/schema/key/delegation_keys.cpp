#include <mandate/schema/key/builder.hpp>
#include <mandate/schema/key/delegation_keys.hpp>

namespace mandate::schema::key {

namespace {

mandate::schema::bytes_t make_signer_key(
    const std::string_view prefix,
    const mandate::schema::signer_id_t& signer) {
  auto b = builder{};
  b.write(prefix);
  b.write(signer);
  return b.data;
}

}  // namespace

mandate::schema::bytes_t make_active_delegation_key(
    const mandate::schema::signer_id_t& delegator) {
  return make_signer_key(kActiveDelegationPrefix, delegator);
}

mandate::schema::bytes_t make_delegation_history_key(
    const mandate::schema::signer_id_t& delegator) {
  return make_signer_key(kDelegationHistoryPrefix, delegator);
}

mandate::schema::bytes_t make_inbound_delegation_key(
    const mandate::schema::signer_id_t& delegate) {
  return make_signer_key(kInboundDelegationPrefix, delegate);
}

mandate::schema::bytes_t make_delegation_id_key(
    const mandate::schema::delegation_id_t delegation_id) {
  auto b = builder{};
  b.write(kDelegationIdPrefix);
  b.write_ordered(delegation_id);
  return b.data;
}

mandate::schema::bytes_t make_event_key(const uint64_t event_id) {
  auto b = builder{};
  b.write(kEventPrefix);
  b.write_ordered(event_id);
  return b.data;
}

mandate::schema::bytes_t make_system_key(const std::string_view key) {
  return mandate::schema::make_bytes(key);
}

}  // namespace mandate::schema::key
