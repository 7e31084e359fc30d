#include <gtest/gtest.h>
#include <mandate/delegation/store.hpp>
#include <mandate/schema/key/delegation_keys.hpp>
#include <mandate/testing/delegation_fixture.hpp>

using namespace mandate::schema;
using mandate::testing::delegation_fixture;

namespace {

delegation_history_entry_t make_entry(const delegation_id_t id) {
  return delegation_history_entry_t{
      .delegation_id = id,
      .delegator = delegation_fixture::signer('A'),
      .delegate = delegation_fixture::signer('B'),
      .created_at = id,
      .ended_at = id + 1,
      .ended_reason = end_reason_t::revoked};
}

}  // namespace

TEST(delegation_store, staged_writes_are_visible_before_commit) {
  auto fixture = delegation_fixture{};
  auto& store = fixture.store();
  auto edge = delegation_edge_t{.delegation_id = 1,
                                .delegator = delegation_fixture::signer('A'),
                                .delegate = delegation_fixture::signer('B'),
                                .active = true};
  store.put_active(edge.delegator, edge);

  EXPECT_TRUE(store.has_pending());
  ASSERT_TRUE(store.get_active(edge.delegator).has_value());
  EXPECT_FALSE(fixture.storage()
                   .get(make_bytes_view(
                       key::make_active_delegation_key(edge.delegator)))
                   .has_value());

  store.commit();
  EXPECT_FALSE(store.has_pending());
  EXPECT_TRUE(fixture.storage()
                  .get(make_bytes_view(
                      key::make_active_delegation_key(edge.delegator)))
                  .has_value());
}

TEST(delegation_store, discard_drops_every_staged_write) {
  auto fixture = delegation_fixture{};
  auto& store = fixture.store();
  auto a = delegation_fixture::signer('A');
  auto b = delegation_fixture::signer('B');

  store.add_inbound(b, a);
  auto id = store.next_delegation_id();
  EXPECT_EQ(id, 1u);
  store.discard();

  EXPECT_TRUE(store.get_inbound(b).empty());
  EXPECT_EQ(store.next_delegation_id(), 1u);
  EXPECT_EQ(store.next_delegation_id(), 2u);
}

TEST(delegation_store, history_is_most_recent_first_and_evicts_oldest) {
  auto fixture = delegation_fixture{3};
  auto& store = fixture.store();
  auto a = delegation_fixture::signer('A');
  for (auto id = delegation_id_t{1}; id <= 5; ++id) {
    store.append_history(a, make_entry(id));
  }
  store.commit();

  auto history = store.get_history(a);
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].delegation_id, 5u);
  EXPECT_EQ(history[2].delegation_id, 3u);
}

TEST(delegation_store, zero_history_capacity_keeps_one_entry) {
  auto fixture = delegation_fixture{0};
  auto& store = fixture.store();
  EXPECT_EQ(store.history_capacity(), 1u);

  auto a = delegation_fixture::signer('A');
  store.append_history(a, make_entry(1));
  store.append_history(a, make_entry(2));
  auto history = store.get_history(a);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].delegation_id, 2u);
}

TEST(delegation_store, inbound_index_ignores_duplicates_and_clears_when_empty) {
  auto fixture = delegation_fixture{};
  auto& store = fixture.store();
  auto a = delegation_fixture::signer('A');
  auto b = delegation_fixture::signer('B');
  auto c = delegation_fixture::signer('C');

  store.add_inbound(c, a);
  store.add_inbound(c, a);
  store.add_inbound(c, b);
  store.commit();
  EXPECT_EQ(store.get_inbound(c), (std::vector<signer_id_t>{a, b}));

  store.remove_inbound(c, a);
  store.remove_inbound(c, b);
  store.commit();
  EXPECT_TRUE(store.get_inbound(c).empty());
  EXPECT_FALSE(fixture.storage()
                   .get(make_bytes_view(key::make_inbound_delegation_key(c)))
                   .has_value());
}

TEST(delegation_store, events_receive_sequential_ids) {
  auto fixture = delegation_fixture{};
  auto& store = fixture.store();
  auto first = store.append_event(
      delegation_event_t{.type = delegation_event_type_t::created,
                         .delegation_id = 1});
  auto second = store.append_event(
      delegation_event_t{.type = delegation_event_type_t::revoked,
                         .delegation_id = 1});
  store.commit();

  EXPECT_EQ(first.event_id, 1u);
  EXPECT_EQ(second.event_id, 2u);
  auto loaded = store.get_event(2);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->type, delegation_event_type_t::revoked);
  EXPECT_FALSE(store.get_event(3).has_value());
}

TEST(delegation_store, delegation_index_maps_id_to_delegator) {
  auto fixture = delegation_fixture{};
  auto& store = fixture.store();
  auto a = delegation_fixture::signer('A');
  store.put_delegation_index(7, a);
  store.commit();

  EXPECT_EQ(store.get_delegation_index(7), std::optional<signer_id_t>{a});
  EXPECT_FALSE(store.get_delegation_index(8).has_value());
}

TEST(delegation_store, evicted_delegations_leave_the_id_index) {
  auto fixture = delegation_fixture{1};
  auto& store = fixture.store();
  auto a = delegation_fixture::signer('A');

  ASSERT_EQ(fixture.create('A', 'B', 10).code, 0u);
  ASSERT_EQ(fixture.lifecycle().revoke(a, a, 20).code, 0u);
  EXPECT_EQ(store.get_delegation_index(1), std::optional<signer_id_t>{a});

  ASSERT_EQ(fixture.create('A', 'C', 30).code, 0u);
  ASSERT_EQ(fixture.lifecycle().revoke(a, a, 40).code, 0u);

  EXPECT_FALSE(store.get_delegation_index(1).has_value());
  EXPECT_FALSE(fixture.storage()
                   .get(make_bytes_view(key::make_delegation_id_key(1)))
                   .has_value());
  EXPECT_EQ(store.get_delegation_index(2), std::optional<signer_id_t>{a});
}
