#pragma once

#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: delegation edge.
// Governance workflow: the single active delegation a delegator holds. An
// absent expiry means the delegation is permanent.
namespace mandate::schema {

template <uint16_t Version>
struct delegation_edge;

template <>
struct delegation_edge<1> final {
  uint16_t version{1};
  delegation_id_t delegation_id{};
  signer_id_t delegator;
  signer_id_t delegate;
  std::optional<ledger_time_t> expiry;
  ledger_time_t created_at{};
  bool active{};
};

using delegation_edge_t = delegation_edge<1>;

/// True once the host clock has reached the edge's expiry.
inline bool is_stale(const delegation_edge_t& edge, const ledger_time_t now) {
  return edge.expiry.has_value() && now >= *edge.expiry;
}

}  // namespace mandate::schema
