#pragma once

#include <mandate/schema/delegation_event.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: resolution result.
// Governance workflow: effective voter handed to the approval path, with the
// walked path and any expiries pruned along the way.
namespace mandate::schema {

template <uint16_t Version>
struct resolution_result;

template <>
struct resolution_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  signer_id_t effective_voter;
  uint32_t hops{};
  std::vector<signer_id_t> path;
  std::vector<delegation_event_t> events;
};

using resolution_result_t = resolution_result<1>;

}  // namespace mandate::schema
