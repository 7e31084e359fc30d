#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <mandate/delegation/resolver.hpp>

using namespace mandate::schema;

namespace mandate::delegation {

std::optional<chain_resolution> resolve(const signer_id_t& start,
                                        const ledger_time_t now,
                                        const uint32_t max_hops,
                                        const edge_lookup_t& active_edge) {
  auto resolution = chain_resolution{};
  resolution.effective_voter = start;
  resolution.path.reserve(max_hops + 1);
  resolution.path.push_back(start);

  while (true) {
    auto edge = active_edge(resolution.effective_voter);
    if (!edge || is_stale(*edge, now)) {
      break;
    }
    if (std::ranges::find(resolution.path, edge->delegate) !=
        std::end(resolution.path)) {
      spdlog::critical(
          "Delegation cycle through {} while resolving {} (edge {})",
          to_string(edge->delegate), to_string(start), edge->delegation_id);
      return std::nullopt;
    }
    if (resolution.hops + 1 > max_hops) {
      spdlog::warn("Resolution of {} capped at {} hop(s) before {}",
                   to_string(start), max_hops, to_string(edge->delegate));
      resolution.depth_capped = true;
      break;
    }
    resolution.effective_voter = edge->delegate;
    resolution.path.push_back(edge->delegate);
    ++resolution.hops;
  }

  return resolution;
}

}  // namespace mandate::delegation
