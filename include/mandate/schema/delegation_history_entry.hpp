#pragma once

#include <mandate/schema/end_reason.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: delegation history entry.
// Governance workflow: audit row in a delegator's capped history log. The row
// appended at creation is open (no end time, no reason); revocation and
// expiry append closed rows.
namespace mandate::schema {

template <uint16_t Version>
struct delegation_history_entry;

template <>
struct delegation_history_entry<1> final {
  uint16_t version{1};
  delegation_id_t delegation_id{};
  signer_id_t delegator;
  signer_id_t delegate;
  ledger_time_t created_at{};
  std::optional<ledger_time_t> ended_at;
  std::optional<end_reason_t> ended_reason;
};

using delegation_history_entry_t = delegation_history_entry<1>;

}  // namespace mandate::schema
