#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <mandate/delegation/lifecycle.hpp>
#include <mandate/storage/memory/storage.hpp>
#include <mandate/storage/rocksdb/storage.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace mandate::schema;

namespace {

constexpr auto kCreateCodespace = std::string_view{"mandate.delegate"};
constexpr auto kRevokeCodespace = std::string_view{"mandate.revoke"};

std::string describe_expiry(const std::optional<ledger_time_t>& expiry) {
  return expiry ? std::to_string(*expiry) : std::string{"never"};
}

bool is_eligible(const std::span<const signer_id_t>& eligible_signers,
                 const signer_id_t& signer) {
  return std::ranges::find(eligible_signers, signer) !=
         std::end(eligible_signers);
}

}  // namespace

namespace mandate::delegation {

template <typename Library>
lifecycle<Library>::lifecycle(store<Library>& store) : store_{store} {}

template <typename Library>
operation_result_t lifecycle<Library>::create(
    const signer_id_t& delegator,
    const signer_id_t& delegate,
    const std::optional<ledger_time_t>& expiry,
    const ledger_time_t now,
    const std::span<const signer_id_t>& eligible_signers) {
  if (!is_eligible(eligible_signers, delegator)) {
    return reject(delegation_error_code::not_eligible, kCreateCodespace,
                  "delegator is not an eligible signer");
  }
  if (!is_eligible(eligible_signers, delegate)) {
    return reject(delegation_error_code::not_eligible, kCreateCodespace,
                  "delegate is not an eligible signer");
  }
  if (delegator == delegate) {
    return reject(delegation_error_code::self_delegation, kCreateCodespace,
                  "delegator and delegate are the same signer");
  }
  if (expiry && *expiry <= now) {
    return reject(delegation_error_code::invalid_expiry, kCreateCodespace,
                  "expiry " + std::to_string(*expiry) +
                      " is not after current time " + std::to_string(now));
  }

  auto events = std::vector<delegation_event_t>{};
  if (auto expired = expire_if_due(delegator, now)) {
    events.push_back(std::move(*expired));
  }
  if (auto existing = store_.get_active(delegator)) {
    return reject(delegation_error_code::already_delegating, kCreateCodespace,
                  "active delegation " +
                      std::to_string(existing->delegation_id) + " to " +
                      to_string(existing->delegate));
  }

  auto downstream =
      resolve(delegate, now, kMaxDelegationDepth,
              [this](const signer_id_t& signer) {
                return store_.get_active(signer);
              });
  if (!downstream) {
    return reject(delegation_error_code::delegation_cycle_detected,
                  kCreateCodespace,
                  "persisted delegation graph contains a cycle");
  }
  if (std::ranges::find(downstream->path, delegator) !=
      std::end(downstream->path)) {
    return reject(delegation_error_code::would_create_cycle, kCreateCodespace,
                  "delegate already resolves to the delegator");
  }
  if (downstream->depth_capped ||
      downstream->hops >= kMaxDelegationDepth) {
    return reject(delegation_error_code::chain_too_long, kCreateCodespace,
                  "chain from delegate already spans " +
                      std::to_string(downstream->hops) + " hop(s)");
  }
  auto budget = kMaxDelegationDepth - 1 - downstream->hops;
  auto upstream = upstream_depth(delegator, now, budget);
  if (upstream > budget) {
    return reject(delegation_error_code::chain_too_long, kCreateCodespace,
                  "resulting chain would span " +
                      std::to_string(upstream + 1 + downstream->hops) +
                      " hop(s)");
  }

  auto edge = delegation_edge_t{};
  edge.delegation_id = store_.next_delegation_id();
  edge.delegator = delegator;
  edge.delegate = delegate;
  edge.expiry = expiry;
  edge.created_at = now;
  edge.active = true;

  store_.put_active(delegator, edge);
  store_.add_inbound(delegate, delegator);
  store_.put_delegation_index(edge.delegation_id, delegator);
  store_.append_history(
      delegator, delegation_history_entry_t{.delegation_id = edge.delegation_id,
                                            .delegator = delegator,
                                            .delegate = delegate,
                                            .created_at = now,
                                            .ended_at = std::nullopt,
                                            .ended_reason = std::nullopt});
  events.push_back(store_.append_event(
      delegation_event_t{.type = delegation_event_type_t::created,
                         .delegation_id = edge.delegation_id,
                         .delegator = delegator,
                         .delegate = delegate,
                         .expiry = expiry,
                         .recorded_at = now}));
  store_.commit();

  spdlog::info("Delegation {} created: {} -> {} (expiry {})",
               edge.delegation_id, to_string(delegator), to_string(delegate),
               describe_expiry(expiry));

  auto result = operation_result_t{};
  result.codespace = std::string{kCreateCodespace};
  result.info = "delegation created";
  result.delegation_id = edge.delegation_id;
  result.events = std::move(events);
  return result;
}

template <typename Library>
operation_result_t lifecycle<Library>::revoke(const signer_id_t& delegator,
                                              const signer_id_t& caller,
                                              const ledger_time_t now) {
  if (caller != delegator) {
    return reject(delegation_error_code::unauthorized, kRevokeCodespace,
                  "only the delegator may revoke its delegation");
  }
  auto edge = store_.get_active(delegator);
  if (!edge || is_stale(*edge, now)) {
    return reject(delegation_error_code::no_active_delegation,
                  kRevokeCodespace, "delegator has no active delegation");
  }

  store_.clear_active(delegator);
  store_.remove_inbound(edge->delegate, delegator);
  store_.append_history(
      delegator,
      delegation_history_entry_t{.delegation_id = edge->delegation_id,
                                 .delegator = delegator,
                                 .delegate = edge->delegate,
                                 .created_at = edge->created_at,
                                 .ended_at = now,
                                 .ended_reason = end_reason_t::revoked});
  auto event = store_.append_event(
      delegation_event_t{.type = delegation_event_type_t::revoked,
                         .delegation_id = edge->delegation_id,
                         .delegator = delegator,
                         .delegate = edge->delegate,
                         .expiry = edge->expiry,
                         .recorded_at = now});
  store_.commit();

  spdlog::info("Delegation {} revoked by {}", edge->delegation_id,
               to_string(delegator));

  auto result = operation_result_t{};
  result.codespace = std::string{kRevokeCodespace};
  result.info = "delegation revoked";
  result.delegation_id = edge->delegation_id;
  result.events.push_back(std::move(event));
  return result;
}

template <typename Library>
std::optional<delegation_event_t> lifecycle<Library>::expire_if_due(
    const signer_id_t& delegator,
    const ledger_time_t now) {
  auto edge = store_.get_active(delegator);
  if (!edge || !is_stale(*edge, now)) {
    return std::nullopt;
  }

  store_.clear_active(delegator);
  store_.remove_inbound(edge->delegate, delegator);
  store_.append_history(
      delegator,
      delegation_history_entry_t{.delegation_id = edge->delegation_id,
                                 .delegator = delegator,
                                 .delegate = edge->delegate,
                                 .created_at = edge->created_at,
                                 .ended_at = edge->expiry,
                                 .ended_reason = end_reason_t::expired});
  spdlog::info("Delegation {} from {} expired at {}", edge->delegation_id,
               to_string(delegator), *edge->expiry);
  return store_.append_event(
      delegation_event_t{.type = delegation_event_type_t::expired,
                         .delegation_id = edge->delegation_id,
                         .delegator = delegator,
                         .delegate = edge->delegate,
                         .expiry = edge->expiry,
                         .recorded_at = now});
}

template <typename Library>
uint32_t lifecycle<Library>::upstream_depth(const signer_id_t& signer,
                                            const ledger_time_t now,
                                            const uint32_t limit) const {
  auto frontier = std::vector<signer_id_t>{signer};
  auto depth = uint32_t{0};
  while (depth <= limit) {
    auto next = std::vector<signer_id_t>{};
    for (const auto& node : frontier) {
      for (const auto& delegator : store_.get_inbound(node)) {
        auto edge = store_.get_active(delegator);
        if (edge && edge->delegate == node && !is_stale(*edge, now)) {
          next.push_back(delegator);
        }
      }
    }
    if (next.empty()) {
      break;
    }
    ++depth;
    frontier = std::move(next);
  }
  return depth;
}

template <typename Library>
operation_result_t lifecycle<Library>::reject(
    const delegation_error_code code,
    const std::string_view codespace,
    std::string info) {
  store_.discard();
  spdlog::debug("{} rejected: {} ({})", codespace, to_string(code), info);

  auto result = operation_result_t{};
  result.code = to_code(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

template class lifecycle<mandate::storage::rocksdb_storage_tag>;
template class lifecycle<mandate::storage::memory_storage_tag>;

}  // namespace mandate::delegation
