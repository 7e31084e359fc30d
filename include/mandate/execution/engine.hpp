#pragma once

#include <mandate/delegation/lifecycle.hpp>
#include <mandate/delegation/store.hpp>
#include <mandate/execution/engine_options.hpp>
#include <mandate/execution/event_observer.hpp>
#include <mandate/schema/ballot.hpp>
#include <mandate/schema/delegation_edge.hpp>
#include <mandate/schema/delegation_event.hpp>
#include <mandate/schema/delegation_history_entry.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/schema/operation_result.hpp>
#include <mandate/schema/primitives.hpp>
#include <mandate/schema/resolution_result.hpp>
#include <mandate/schema/vote_kind.hpp>
#include <mandate/storage/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace mandate::execution {

/// Most notifications returned by one `events` call.
inline constexpr uint64_t kMaxEventPage = 256;

using delegation_record_t =
    std::variant<mandate::schema::delegation_edge_t,
                 mandate::schema::delegation_history_entry_t>;

/// Entry point for delegation management and vote routing.
///
/// Every public call is serialized on one mutex and leaves the store either
/// fully committed or untouched. Observers run after the commit with the lock
/// still held and must not call back into the engine.
template <typename Library>
class engine final {
 public:
  engine(mandate::schema::encoding::scale_encoder_t& encoder,
         mandate::storage::storage<Library>& storage,
         engine_options options = {});

  /// Create `delegator -> delegate`. Both must be in `eligible_signers`.
  mandate::schema::operation_result_t delegate(
      const mandate::schema::signer_id_t& delegator,
      const mandate::schema::signer_id_t& delegate,
      const std::optional<mandate::schema::ledger_time_t>& expiry,
      mandate::schema::ledger_time_t now,
      const std::span<const mandate::schema::signer_id_t>& eligible_signers);

  /// Revoke the live delegation owned by `delegator`.
  mandate::schema::operation_result_t revoke(
      const mandate::schema::signer_id_t& delegator,
      const mandate::schema::signer_id_t& caller,
      mandate::schema::ledger_time_t now);

  /// Follow live delegations from `signer` to whoever votes on its behalf.
  ///
  /// Edges found expired on the way are pruned and reported in `events`.
  /// A signer with no live delegation is its own effective voter.
  mandate::schema::resolution_result_t resolve_effective_voter(
      const mandate::schema::signer_id_t& signer,
      mandate::schema::ledger_time_t now);

  /// Live edge owned by `delegator`, after pruning it if expired.
  std::optional<mandate::schema::delegation_edge_t> get_active_delegation(
      const mandate::schema::signer_id_t& delegator,
      mandate::schema::ledger_time_t now);

  /// Ended and open delegations of `delegator`, most recent first.
  std::vector<mandate::schema::delegation_history_entry_t> get_history(
      const mandate::schema::signer_id_t& delegator,
      mandate::schema::ledger_time_t now);

  /// Look a delegation up by id: the live edge while it lasts, otherwise the
  /// retained history entry. std::nullopt once evicted or never issued.
  std::optional<delegation_record_t> get_delegation(
      mandate::schema::delegation_id_t delegation_id,
      mandate::schema::ledger_time_t now);

  /// Record `signer`'s vote on `ballot` under its effective voter.
  ///
  /// Fails with `already_voted` when the effective voter is already in
  /// either set; the ballot is left unchanged on any failure.
  mandate::schema::resolution_result_t record_vote(
      mandate::schema::ballot_t& ballot,
      const mandate::schema::signer_id_t& signer,
      mandate::schema::vote_kind_t kind,
      mandate::schema::ledger_time_t now);

  /// Notifications with ids in the inclusive range, oldest first.
  std::vector<mandate::schema::delegation_event_t> events(
      uint64_t from_event_id,
      uint64_t to_event_id) const;

  /// BLAKE3 digest over every delegation record.
  mandate::schema::hash32_t state_root() const;

  /// Install a callback invoked for each committed notification.
  void set_event_observer(event_observer_t observer);

 private:
  mandate::schema::resolution_result_t resolve_locked(
      const mandate::schema::signer_id_t& signer,
      mandate::schema::ledger_time_t now,
      std::string_view codespace);

  /// Commit staged expiries and hand them to the observer.
  void commit_expiries(
      const std::vector<mandate::schema::delegation_event_t>& events);
  void publish(const std::vector<mandate::schema::delegation_event_t>& events);

  mutable std::mutex mutex_;
  mandate::storage::storage<Library>& storage_;
  mandate::delegation::store<Library> store_;
  mandate::delegation::lifecycle<Library> lifecycle_;
  event_observer_t observer_;
};

}  // namespace mandate::execution
