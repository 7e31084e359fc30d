#pragma once

#include <mandate/schema/delegation_edge.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace mandate::delegation {

/// Longest chain of active edges the graph may hold.
inline constexpr uint32_t kMaxDelegationDepth = 3;

using edge_lookup_t = std::function<std::optional<
    mandate::schema::delegation_edge_t>(const mandate::schema::signer_id_t&)>;

struct chain_resolution final {
  mandate::schema::signer_id_t effective_voter;
  uint32_t hops{};
  /// Every signer visited, starting signer first and effective voter last.
  std::vector<mandate::schema::signer_id_t> path;
  /// The walk stopped at `max_hops` with an edge still leading onward.
  bool depth_capped{};
};

/// Follow active edges from `start` to the effective voter.
///
/// Stale edges (expiry reached) end the walk without being followed. Returns
/// std::nullopt when an edge leads back to a signer already on the path: the
/// persisted graph is corrupt and the caller must abort instead of voting.
std::optional<chain_resolution> resolve(
    const mandate::schema::signer_id_t& start,
    mandate::schema::ledger_time_t now,
    uint32_t max_hops,
    const edge_lookup_t& active_edge);

}  // namespace mandate::delegation
