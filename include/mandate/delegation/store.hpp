#pragma once

#include <mandate/schema/delegation_edge.hpp>
#include <mandate/schema/delegation_event.hpp>
#include <mandate/schema/delegation_history_entry.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/schema/primitives.hpp>
#include <mandate/storage/storage.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace mandate::delegation {

inline constexpr uint32_t kDefaultHistoryCapacity = 32;

/// Key-value persistence for delegation state. No validation and no notion of
/// time: callers own every invariant.
///
/// Writes are staged in memory and become durable only on `commit()`, as one
/// atomic batch. Reads see staged writes first, so a caller can validate
/// against the state it is about to produce and `discard()` everything when a
/// check fails.
template <typename Library>
class store final {
 public:
  store(mandate::schema::encoding::scale_encoder_t& encoder,
        mandate::storage::storage<Library>& storage,
        uint32_t history_capacity = kDefaultHistoryCapacity);

  std::optional<mandate::schema::delegation_edge_t> get_active(
      const mandate::schema::signer_id_t& delegator) const;
  void put_active(const mandate::schema::signer_id_t& delegator,
                  const mandate::schema::delegation_edge_t& edge);
  void clear_active(const mandate::schema::signer_id_t& delegator);

  /// Prepend to the delegator's log, evicting the oldest entries past
  /// capacity.
  void append_history(const mandate::schema::signer_id_t& delegator,
                      const mandate::schema::delegation_history_entry_t& entry);
  /// Most recent first.
  std::vector<mandate::schema::delegation_history_entry_t> get_history(
      const mandate::schema::signer_id_t& delegator) const;

  /// Delegators whose edges point at `delegate`. Entries may be stale until
  /// the owning edge is pruned.
  std::vector<mandate::schema::signer_id_t> get_inbound(
      const mandate::schema::signer_id_t& delegate) const;
  void add_inbound(const mandate::schema::signer_id_t& delegate,
                   const mandate::schema::signer_id_t& delegator);
  void remove_inbound(const mandate::schema::signer_id_t& delegate,
                      const mandate::schema::signer_id_t& delegator);

  /// Reserve the next delegation id. Ids start at 1.
  mandate::schema::delegation_id_t next_delegation_id();
  void put_delegation_index(mandate::schema::delegation_id_t delegation_id,
                            const mandate::schema::signer_id_t& delegator);
  std::optional<mandate::schema::signer_id_t> get_delegation_index(
      mandate::schema::delegation_id_t delegation_id) const;

  /// Assign the next event id, stage the event, and return it.
  mandate::schema::delegation_event_t append_event(
      mandate::schema::delegation_event_t event);
  std::optional<mandate::schema::delegation_event_t> get_event(
      uint64_t event_id) const;

  uint32_t history_capacity() const { return history_capacity_; }
  bool has_pending() const { return !pending_.empty(); }
  void commit();
  void discard();

 private:
  std::optional<mandate::schema::bytes_t> read(
      const mandate::schema::bytes_t& key) const;
  void stage(mandate::schema::bytes_t key,
             std::optional<mandate::schema::bytes_t> value);
  uint64_t next_sequence(const mandate::schema::bytes_t& key);

  template <typename T>
  std::optional<T> read_as(const mandate::schema::bytes_t& key) const;
  template <typename T>
  void stage_as(mandate::schema::bytes_t key, const T& value);

  mandate::schema::encoding::scale_encoder_t& encoder_;
  mandate::storage::storage<Library>& storage_;
  uint32_t history_capacity_{kDefaultHistoryCapacity};
  std::map<mandate::schema::bytes_t, std::optional<mandate::schema::bytes_t>>
      pending_;
};

}  // namespace mandate::delegation
