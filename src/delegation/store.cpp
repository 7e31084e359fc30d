#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <mandate/common/critical.hpp>
#include <mandate/delegation/store.hpp>
#include <mandate/schema/key/delegation_keys.hpp>
#include <mandate/storage/memory/storage.hpp>
#include <mandate/storage/rocksdb/storage.hpp>
#include <utility>
#include <vector>

using namespace mandate::schema;

namespace mandate::delegation {

template <typename Library>
store<Library>::store(mandate::schema::encoding::scale_encoder_t& encoder,
                      mandate::storage::storage<Library>& storage,
                      uint32_t history_capacity)
    : encoder_{encoder},
      storage_{storage},
      history_capacity_{history_capacity} {
  if (history_capacity_ == 0) {
    spdlog::warn("History capacity 0 requested; keeping 1 entry");
    history_capacity_ = 1;
  }
}

template <typename Library>
std::optional<delegation_edge_t> store<Library>::get_active(
    const signer_id_t& delegator) const {
  return read_as<delegation_edge_t>(key::make_active_delegation_key(delegator));
}

template <typename Library>
void store<Library>::put_active(const signer_id_t& delegator,
                                const delegation_edge_t& edge) {
  stage_as(key::make_active_delegation_key(delegator), edge);
}

template <typename Library>
void store<Library>::clear_active(const signer_id_t& delegator) {
  stage(key::make_active_delegation_key(delegator), std::nullopt);
}

template <typename Library>
void store<Library>::append_history(const signer_id_t& delegator,
                                    const delegation_history_entry_t& entry) {
  auto history = get_history(delegator);
  history.insert(std::begin(history), entry);
  if (history.size() <= history_capacity_) {
    stage_as(key::make_delegation_history_key(delegator), history);
    return;
  }

  auto evicted = std::vector<delegation_history_entry_t>{
      std::next(std::begin(history),
                static_cast<std::ptrdiff_t>(history_capacity_)),
      std::end(history)};
  history.resize(history_capacity_);
  stage_as(key::make_delegation_history_key(delegator), history);

  // An id stays resolvable while its edge is live or any kept entry names it.
  auto active = get_active(delegator);
  for (const auto& dropped : evicted) {
    auto id = dropped.delegation_id;
    if (active && active->delegation_id == id) {
      continue;
    }
    if (std::ranges::any_of(history, [id](const auto& kept) {
          return kept.delegation_id == id;
        })) {
      continue;
    }
    stage(key::make_delegation_id_key(id), std::nullopt);
  }
}

template <typename Library>
std::vector<delegation_history_entry_t> store<Library>::get_history(
    const signer_id_t& delegator) const {
  return read_as<std::vector<delegation_history_entry_t>>(
             key::make_delegation_history_key(delegator))
      .value_or(std::vector<delegation_history_entry_t>{});
}

template <typename Library>
std::vector<signer_id_t> store<Library>::get_inbound(
    const signer_id_t& delegate) const {
  return read_as<std::vector<signer_id_t>>(
             key::make_inbound_delegation_key(delegate))
      .value_or(std::vector<signer_id_t>{});
}

template <typename Library>
void store<Library>::add_inbound(const signer_id_t& delegate,
                                 const signer_id_t& delegator) {
  auto inbound = get_inbound(delegate);
  if (std::ranges::find(inbound, delegator) != std::end(inbound)) {
    return;
  }
  inbound.push_back(delegator);
  stage_as(key::make_inbound_delegation_key(delegate), inbound);
}

template <typename Library>
void store<Library>::remove_inbound(const signer_id_t& delegate,
                                    const signer_id_t& delegator) {
  auto inbound = get_inbound(delegate);
  auto removed = std::erase(inbound, delegator);
  if (removed == 0) {
    return;
  }
  auto key = key::make_inbound_delegation_key(delegate);
  if (inbound.empty()) {
    stage(std::move(key), std::nullopt);
  } else {
    stage_as(std::move(key), inbound);
  }
}

template <typename Library>
delegation_id_t store<Library>::next_delegation_id() {
  return next_sequence(key::make_system_key(key::kNextDelegationIdKey));
}

template <typename Library>
void store<Library>::put_delegation_index(const delegation_id_t delegation_id,
                                          const signer_id_t& delegator) {
  stage_as(key::make_delegation_id_key(delegation_id), delegator);
}

template <typename Library>
std::optional<signer_id_t> store<Library>::get_delegation_index(
    const delegation_id_t delegation_id) const {
  return read_as<signer_id_t>(key::make_delegation_id_key(delegation_id));
}

template <typename Library>
delegation_event_t store<Library>::append_event(delegation_event_t event) {
  event.event_id = next_sequence(key::make_system_key(key::kNextEventIdKey));
  stage_as(key::make_event_key(event.event_id), event);
  return event;
}

template <typename Library>
std::optional<delegation_event_t> store<Library>::get_event(
    const uint64_t event_id) const {
  return read_as<delegation_event_t>(key::make_event_key(event_id));
}

template <typename Library>
void store<Library>::commit() {
  if (pending_.empty()) {
    return;
  }
  auto entries = std::vector<mandate::storage::write_entry_t>{};
  entries.reserve(pending_.size());
  for (auto& [key, value] : pending_) {
    entries.emplace_back(key, std::move(value));
  }
  pending_.clear();
  storage_.write(entries);
  spdlog::debug("Committed {} delegation store write(s)", entries.size());
}

template <typename Library>
void store<Library>::discard() {
  if (!pending_.empty()) {
    spdlog::debug("Discarding {} staged delegation store write(s)",
                  pending_.size());
  }
  pending_.clear();
}

template <typename Library>
std::optional<bytes_t> store<Library>::read(const bytes_t& key) const {
  if (auto it = pending_.find(key); it != std::end(pending_)) {
    return it->second;
  }
  return storage_.get(bytes_view_t{key.data(), key.size()});
}

template <typename Library>
void store<Library>::stage(bytes_t key, std::optional<bytes_t> value) {
  pending_.insert_or_assign(std::move(key), std::move(value));
}

template <typename Library>
uint64_t store<Library>::next_sequence(const bytes_t& key) {
  auto next = read_as<uint64_t>(key).value_or(1);
  stage_as(key, next + 1);
  return next;
}

template <typename Library>
template <typename T>
std::optional<T> store<Library>::read_as(const bytes_t& key) const {
  auto raw = read(key);
  if (!raw) {
    return std::nullopt;
  }
  auto decoded = encoder_.template try_decode<T>(
      bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    spdlog::error("Undecodable delegation record under key '{}'",
                  to_hex(bytes_view_t{key.data(), key.size()}));
    mandate::common::critical("failed to decode persisted delegation state");
  }
  return decoded;
}

template <typename Library>
template <typename T>
void store<Library>::stage_as(bytes_t key, const T& value) {
  stage(std::move(key), encoder_.encode(value));
}

template class store<mandate::storage::rocksdb_storage_tag>;
template class store<mandate::storage::memory_storage_tag>;

}  // namespace mandate::delegation
