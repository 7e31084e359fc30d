#pragma once

#include <mandate/delegation/resolver.hpp>
#include <mandate/delegation/store.hpp>
#include <mandate/schema/delegation_error_code.hpp>
#include <mandate/schema/delegation_event.hpp>
#include <mandate/schema/operation_result.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mandate::delegation {

/// Validates and applies delegation transitions for each delegator:
/// no delegation -> active -> revoked | expired -> no delegation.
///
/// `create` and `revoke` are all-or-nothing: every check runs against staged
/// state and the store is committed only once all of them pass.
template <typename Library>
class lifecycle final {
 public:
  explicit lifecycle(store<Library>& store);

  /// Create `delegator -> delegate`, optionally ending at `expiry`.
  ///
  /// Rejects ineligible signers, self delegation, expiries not after `now`,
  /// delegators that already hold a live edge, edges that would close a
  /// cycle, and edges that would stretch any chain past
  /// `kMaxDelegationDepth`.
  mandate::schema::operation_result_t create(
      const mandate::schema::signer_id_t& delegator,
      const mandate::schema::signer_id_t& delegate,
      const std::optional<mandate::schema::ledger_time_t>& expiry,
      mandate::schema::ledger_time_t now,
      const std::span<const mandate::schema::signer_id_t>& eligible_signers);

  /// End the delegator's live edge. Only the delegator may revoke.
  mandate::schema::operation_result_t revoke(
      const mandate::schema::signer_id_t& delegator,
      const mandate::schema::signer_id_t& caller,
      mandate::schema::ledger_time_t now);

  /// Stage the expiry of the delegator's edge when `now` has reached it.
  ///
  /// Returns the staged notification, or std::nullopt when nothing was due.
  /// The caller commits.
  std::optional<mandate::schema::delegation_event_t> expire_if_due(
      const mandate::schema::signer_id_t& delegator,
      mandate::schema::ledger_time_t now);

 private:
  /// Length of the longest live chain that ends at `signer`, walking at most
  /// `limit + 1` levels. A result above `limit` means the chain is too long.
  uint32_t upstream_depth(const mandate::schema::signer_id_t& signer,
                          mandate::schema::ledger_time_t now,
                          uint32_t limit) const;

  mandate::schema::operation_result_t reject(
      mandate::schema::delegation_error_code code,
      std::string_view codespace,
      std::string info);

  store<Library>& store_;
};

}  // namespace mandate::delegation
