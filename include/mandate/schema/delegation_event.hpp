#pragma once

#include <mandate/schema/delegation_event_type.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: delegation event.
// Governance workflow: structured notification emitted once per committed
// transition and persisted with a sequential id for observers.
namespace mandate::schema {

template <uint16_t Version>
struct delegation_event;

template <>
struct delegation_event<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  delegation_event_type_t type{};
  delegation_id_t delegation_id{};
  signer_id_t delegator;
  signer_id_t delegate;
  std::optional<ledger_time_t> expiry;
  ledger_time_t recorded_at{};
};

using delegation_event_t = delegation_event<1>;

}  // namespace mandate::schema
