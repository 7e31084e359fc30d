#pragma once

#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: ballot.
// Governance workflow: a proposal's approval and abstention sets, owned by
// the proposal component and keyed by effective voter.
namespace mandate::schema {

template <uint16_t Version>
struct ballot;

template <>
struct ballot<1> final {
  uint16_t version{1};
  hash32_t proposal_id{};
  std::vector<signer_id_t> approvals;
  std::vector<signer_id_t> abstentions;
};

using ballot_t = ballot<1>;

}  // namespace mandate::schema
