#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <mandate/blake3/hash.hpp>
#include <mandate/delegation/resolver.hpp>
#include <mandate/execution/engine.hpp>
#include <mandate/schema/delegation_error_code.hpp>
#include <mandate/schema/key/delegation_keys.hpp>
#include <mandate/storage/memory/storage.hpp>
#include <mandate/storage/rocksdb/storage.hpp>
#include <utility>

using namespace mandate::schema;

namespace {

constexpr auto kResolveCodespace = std::string_view{"mandate.resolve"};
constexpr auto kVoteCodespace = std::string_view{"mandate.vote"};

bool contains(const std::vector<signer_id_t>& signers,
              const signer_id_t& signer) {
  return std::ranges::find(signers, signer) != std::end(signers);
}

}  // namespace

namespace mandate::execution {

template <typename Library>
engine<Library>::engine(encoding::scale_encoder_t& encoder,
                        mandate::storage::storage<Library>& storage,
                        engine_options options)
    : storage_{storage},
      store_{encoder, storage, options.history_capacity},
      lifecycle_{store_} {
  spdlog::info("Delegation engine ready (history capacity {}, max depth {})",
               store_.history_capacity(),
               mandate::delegation::kMaxDelegationDepth);
}

template <typename Library>
operation_result_t engine<Library>::delegate(
    const signer_id_t& delegator,
    const signer_id_t& delegate,
    const std::optional<ledger_time_t>& expiry,
    const ledger_time_t now,
    const std::span<const signer_id_t>& eligible_signers) {
  auto lock = std::scoped_lock{mutex_};
  auto result =
      lifecycle_.create(delegator, delegate, expiry, now, eligible_signers);
  if (result.code == 0) {
    publish(result.events);
  }
  return result;
}

template <typename Library>
operation_result_t engine<Library>::revoke(const signer_id_t& delegator,
                                           const signer_id_t& caller,
                                           const ledger_time_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto result = lifecycle_.revoke(delegator, caller, now);
  if (result.code == 0) {
    publish(result.events);
  }
  return result;
}

template <typename Library>
resolution_result_t engine<Library>::resolve_effective_voter(
    const signer_id_t& signer,
    const ledger_time_t now) {
  auto lock = std::scoped_lock{mutex_};
  return resolve_locked(signer, now, kResolveCodespace);
}

template <typename Library>
std::optional<delegation_edge_t> engine<Library>::get_active_delegation(
    const signer_id_t& delegator,
    const ledger_time_t now) {
  auto lock = std::scoped_lock{mutex_};
  if (auto expired = lifecycle_.expire_if_due(delegator, now)) {
    commit_expiries({*expired});
  }
  return store_.get_active(delegator);
}

template <typename Library>
std::vector<delegation_history_entry_t> engine<Library>::get_history(
    const signer_id_t& delegator,
    const ledger_time_t now) {
  auto lock = std::scoped_lock{mutex_};
  if (auto expired = lifecycle_.expire_if_due(delegator, now)) {
    commit_expiries({*expired});
  }
  return store_.get_history(delegator);
}

template <typename Library>
std::optional<delegation_record_t> engine<Library>::get_delegation(
    const delegation_id_t delegation_id,
    const ledger_time_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto delegator = store_.get_delegation_index(delegation_id);
  if (!delegator) {
    return std::nullopt;
  }
  if (auto expired = lifecycle_.expire_if_due(*delegator, now)) {
    commit_expiries({*expired});
  }
  if (auto edge = store_.get_active(*delegator);
      edge && edge->delegation_id == delegation_id) {
    return delegation_record_t{*edge};
  }
  // Ended entries are prepended after the open one, so the first match is the
  // latest state of that delegation.
  for (const auto& entry : store_.get_history(*delegator)) {
    if (entry.delegation_id == delegation_id) {
      return delegation_record_t{entry};
    }
  }
  return std::nullopt;
}

template <typename Library>
resolution_result_t engine<Library>::record_vote(ballot_t& ballot,
                                                 const signer_id_t& signer,
                                                 const vote_kind_t kind,
                                                 const ledger_time_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto result = resolve_locked(signer, now, kVoteCodespace);
  if (result.code != 0) {
    return result;
  }
  if (contains(ballot.approvals, result.effective_voter) ||
      contains(ballot.abstentions, result.effective_voter)) {
    spdlog::debug("{} already voted on proposal {} (via {})",
                  to_string(result.effective_voter),
                  to_hex(bytes_view_t{ballot.proposal_id.data(),
                                      ballot.proposal_id.size()}),
                  to_string(signer));
    result.code = to_code(delegation_error_code::already_voted);
    result.log = std::string{to_string(delegation_error_code::already_voted)};
    return result;
  }

  switch (kind) {
    case vote_kind_t::approve:
      ballot.approvals.push_back(result.effective_voter);
      break;
    case vote_kind_t::abstain:
      ballot.abstentions.push_back(result.effective_voter);
      break;
  }
  spdlog::info("Recorded {} from {} on behalf of {} ({} hop(s))",
               to_string(kind), to_string(result.effective_voter),
               to_string(signer), result.hops);
  return result;
}

template <typename Library>
std::vector<delegation_event_t> engine<Library>::events(
    uint64_t from_event_id,
    uint64_t to_event_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<delegation_event_t>{};
  from_event_id = std::max<uint64_t>(from_event_id, 1);
  if (to_event_id < from_event_id) {
    return out;
  }
  if (to_event_id - from_event_id >= kMaxEventPage) {
    to_event_id = from_event_id + (kMaxEventPage - 1);
  }
  for (auto event_id = from_event_id;; ++event_id) {
    auto event = store_.get_event(event_id);
    if (!event) {
      break;
    }
    out.push_back(std::move(*event));
    if (event_id == to_event_id) {
      break;
    }
  }
  return out;
}

template <typename Library>
hash32_t engine<Library>::state_root() const {
  auto lock = std::scoped_lock{mutex_};
  auto entries =
      storage_.list_by_prefix(make_bytes_view(key::kDelegationPrefix));
  auto digest = mandate::blake3::hasher{};
  for (const auto& [entry_key, entry_value] : entries) {
    digest.update_framed(bytes_view_t{entry_key.data(), entry_key.size()})
        .update_framed(bytes_view_t{entry_value.data(), entry_value.size()});
  }
  return digest.finalize();
}

template <typename Library>
void engine<Library>::set_event_observer(event_observer_t observer) {
  auto lock = std::scoped_lock{mutex_};
  observer_ = std::move(observer);
}

template <typename Library>
resolution_result_t engine<Library>::resolve_locked(
    const signer_id_t& signer,
    const ledger_time_t now,
    const std::string_view codespace) {
  auto result = resolution_result_t{};
  result.codespace = std::string{codespace};

  auto expired = std::vector<delegation_event_t>{};
  auto resolution = mandate::delegation::resolve(
      signer, now, mandate::delegation::kMaxDelegationDepth,
      [this, now, &expired](const signer_id_t& delegator) {
        if (auto event = lifecycle_.expire_if_due(delegator, now)) {
          expired.push_back(std::move(*event));
        }
        return store_.get_active(delegator);
      });
  if (!resolution) {
    store_.discard();
    result.code = to_code(delegation_error_code::delegation_cycle_detected);
    result.log = std::string{
        to_string(delegation_error_code::delegation_cycle_detected)};
    return result;
  }

  commit_expiries(expired);
  result.effective_voter = resolution->effective_voter;
  result.hops = resolution->hops;
  result.path = std::move(resolution->path);
  result.events = std::move(expired);
  return result;
}

template <typename Library>
void engine<Library>::commit_expiries(
    const std::vector<delegation_event_t>& events) {
  store_.commit();
  publish(events);
}

template <typename Library>
void engine<Library>::publish(const std::vector<delegation_event_t>& events) {
  if (!observer_) {
    return;
  }
  for (const auto& event : events) {
    observer_(event);
  }
}

template class engine<mandate::storage::rocksdb_storage_tag>;
template class engine<mandate::storage::memory_storage_tag>;

}  // namespace mandate::execution
