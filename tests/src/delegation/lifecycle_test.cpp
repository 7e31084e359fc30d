#include <gtest/gtest.h>
#include <mandate/delegation/lifecycle.hpp>
#include <mandate/schema/delegation_error_code.hpp>
#include <mandate/schema/key/delegation_keys.hpp>
#include <mandate/testing/delegation_fixture.hpp>

#include <algorithm>

using namespace mandate::schema;
using mandate::testing::delegation_fixture;

namespace {

uint32_t code_of(const delegation_error_code code) {
  return to_code(code);
}

std::size_t delegation_record_count(delegation_fixture& fixture) {
  return fixture.storage()
      .list_by_prefix(make_bytes_view(key::kDelegationPrefix))
      .size();
}

}  // namespace

TEST(delegation_lifecycle, create_stores_edge_history_and_event) {
  auto fixture = delegation_fixture{};
  auto result = fixture.create('A', 'B', 10);
  ASSERT_EQ(result.code, 0u);
  ASSERT_TRUE(result.delegation_id.has_value());
  EXPECT_EQ(*result.delegation_id, 1u);
  EXPECT_EQ(result.codespace, "mandate.delegate");

  auto edge = fixture.store().get_active(delegation_fixture::signer('A'));
  ASSERT_TRUE(edge.has_value());
  EXPECT_EQ(edge->delegate, delegation_fixture::signer('B'));
  EXPECT_EQ(edge->created_at, 10u);
  EXPECT_FALSE(edge->expiry.has_value());
  EXPECT_TRUE(edge->active);

  auto history = fixture.store().get_history(delegation_fixture::signer('A'));
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].delegation_id, 1u);
  EXPECT_FALSE(history[0].ended_at.has_value());
  EXPECT_FALSE(history[0].ended_reason.has_value());

  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, delegation_event_type_t::created);
  EXPECT_EQ(result.events[0].event_id, 1u);
  EXPECT_EQ(fixture.store().get_inbound(delegation_fixture::signer('B')),
            (std::vector<signer_id_t>{delegation_fixture::signer('A')}));
  EXPECT_FALSE(fixture.store().has_pending());
}

TEST(delegation_lifecycle, ineligible_signers_are_rejected) {
  auto fixture = delegation_fixture{};
  EXPECT_EQ(fixture.create('A', 'Z').code,
            code_of(delegation_error_code::not_eligible));
  EXPECT_EQ(fixture.create('Z', 'A').code,
            code_of(delegation_error_code::not_eligible));
  EXPECT_EQ(delegation_record_count(fixture), 0u);
}

TEST(delegation_lifecycle, self_delegation_is_rejected) {
  auto fixture = delegation_fixture{};
  auto result = fixture.create('A', 'A');
  EXPECT_EQ(result.code, code_of(delegation_error_code::self_delegation));
  EXPECT_EQ(result.log, "self delegation");
  EXPECT_FALSE(fixture.store().get_active(delegation_fixture::signer('A')));
}

TEST(delegation_lifecycle, expiry_must_be_in_the_future) {
  auto fixture = delegation_fixture{};
  EXPECT_EQ(fixture.create('A', 'B', 10, 10).code,
            code_of(delegation_error_code::invalid_expiry));
  EXPECT_EQ(fixture.create('A', 'B', 10, 5).code,
            code_of(delegation_error_code::invalid_expiry));
  EXPECT_EQ(fixture.create('A', 'B', 10, 11).code, 0u);
}

TEST(delegation_lifecycle, second_delegation_requires_revoking_the_first) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'B').code, 0u);
  EXPECT_EQ(fixture.create('A', 'C').code,
            code_of(delegation_error_code::already_delegating));

  ASSERT_EQ(fixture.lifecycle()
                .revoke(delegation_fixture::signer('A'),
                        delegation_fixture::signer('A'), 20)
                .code,
            0u);
  auto result = fixture.create('A', 'C', 30);
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(*result.delegation_id, 2u);
}

TEST(delegation_lifecycle, reverse_edge_would_create_cycle) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'B').code, 0u);
  auto result = fixture.create('B', 'A');
  EXPECT_EQ(result.code, code_of(delegation_error_code::would_create_cycle));
  EXPECT_FALSE(fixture.store().get_active(delegation_fixture::signer('B')));
}

TEST(delegation_lifecycle, longer_cycle_is_rejected) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'B').code, 0u);
  ASSERT_EQ(fixture.create('B', 'C').code, 0u);
  EXPECT_EQ(fixture.create('C', 'A').code,
            code_of(delegation_error_code::would_create_cycle));
}

TEST(delegation_lifecycle, chains_are_capped_at_three_hops) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'B').code, 0u);
  ASSERT_EQ(fixture.create('B', 'C').code, 0u);
  ASSERT_EQ(fixture.create('C', 'D').code, 0u);

  auto extend_tail = fixture.create('D', 'E');
  EXPECT_EQ(extend_tail.code, code_of(delegation_error_code::chain_too_long));
  auto extend_head = fixture.create('E', 'A');
  EXPECT_EQ(extend_head.code, code_of(delegation_error_code::chain_too_long));

  EXPECT_FALSE(fixture.store().get_active(delegation_fixture::signer('D')));
  EXPECT_FALSE(fixture.store().get_active(delegation_fixture::signer('E')));
  EXPECT_TRUE(fixture.store().get_inbound(delegation_fixture::signer('E')).empty());
}

TEST(delegation_lifecycle, joining_two_chains_counts_both_sides) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'B').code, 0u);
  ASSERT_EQ(fixture.create('C', 'D').code, 0u);
  ASSERT_EQ(fixture.create('D', 'E').code, 0u);
  // A -> B -> C -> D -> E would be four hops.
  EXPECT_EQ(fixture.create('B', 'C').code,
            code_of(delegation_error_code::chain_too_long));
  // F -> A -> B is fine.
  EXPECT_EQ(fixture.create('F', 'A').code, 0u);
}

TEST(delegation_lifecycle, fan_in_counts_the_longest_upstream_branch) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'C').code, 0u);
  ASSERT_EQ(fixture.create('B', 'C').code, 0u);
  ASSERT_EQ(fixture.create('F', 'A').code, 0u);
  // F -> A -> C -> D is three hops; B -> C is the shorter branch.
  ASSERT_EQ(fixture.create('C', 'D').code, 0u);

  auto rejected = fixture.create('D', 'E');
  EXPECT_EQ(rejected.code, code_of(delegation_error_code::chain_too_long));
  EXPECT_FALSE(fixture.store().get_active(delegation_fixture::signer('D')));
}

TEST(delegation_lifecycle, expired_upstream_edges_do_not_count) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'B', 10, 50).code, 0u);
  ASSERT_EQ(fixture.create('B', 'C', 10).code, 0u);
  ASSERT_EQ(fixture.create('C', 'D', 10).code, 0u);
  EXPECT_EQ(fixture.create('D', 'E', 40).code,
            code_of(delegation_error_code::chain_too_long));
  EXPECT_EQ(fixture.create('D', 'E', 60).code, 0u);
}

TEST(delegation_lifecycle, expiry_is_applied_once) {
  auto fixture = delegation_fixture{};
  auto a = delegation_fixture::signer('A');
  ASSERT_EQ(fixture.create('A', 'B', 10, 100).code, 0u);

  EXPECT_FALSE(fixture.lifecycle().expire_if_due(a, 99).has_value());
  auto event = fixture.lifecycle().expire_if_due(a, 100);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type, delegation_event_type_t::expired);
  EXPECT_EQ(event->recorded_at, 100u);
  fixture.store().commit();

  EXPECT_FALSE(fixture.lifecycle().expire_if_due(a, 101).has_value());
  EXPECT_FALSE(fixture.store().get_active(a).has_value());
  EXPECT_TRUE(fixture.store().get_inbound(delegation_fixture::signer('B')).empty());

  auto history = fixture.store().get_history(a);
  auto expired = std::ranges::count_if(history, [](const auto& entry) {
    return entry.ended_reason == std::optional<end_reason_t>{end_reason_t::expired};
  });
  EXPECT_EQ(expired, 1);
  EXPECT_EQ(history[0].ended_at, std::optional<ledger_time_t>{100});
}

TEST(delegation_lifecycle, create_replaces_an_expired_edge) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'B', 10, 50).code, 0u);
  auto result = fixture.create('A', 'C', 60);
  ASSERT_EQ(result.code, 0u);
  ASSERT_EQ(result.events.size(), 2u);
  EXPECT_EQ(result.events[0].type, delegation_event_type_t::expired);
  EXPECT_EQ(result.events[1].type, delegation_event_type_t::created);
  EXPECT_EQ(fixture.store().get_active(delegation_fixture::signer('A'))->delegate,
            delegation_fixture::signer('C'));
}

TEST(delegation_lifecycle, rejected_create_leaves_expired_edge_in_place) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'B', 10, 50).code, 0u);
  ASSERT_EQ(fixture.create('C', 'A', 10).code, 0u);
  auto before = fixture.storage().list_by_prefix(
      make_bytes_view(key::kDelegationPrefix));

  // The expired A -> B edge would be pruned, but A -> C closes a cycle.
  EXPECT_EQ(fixture.create('A', 'C', 60).code,
            code_of(delegation_error_code::would_create_cycle));
  EXPECT_EQ(fixture.storage().list_by_prefix(
                make_bytes_view(key::kDelegationPrefix)),
            before);
  EXPECT_FALSE(fixture.store().has_pending());
}

TEST(delegation_lifecycle, only_the_delegator_may_revoke) {
  auto fixture = delegation_fixture{};
  ASSERT_EQ(fixture.create('A', 'B').code, 0u);
  auto result = fixture.lifecycle().revoke(delegation_fixture::signer('A'),
                                           delegation_fixture::signer('B'), 20);
  EXPECT_EQ(result.code, code_of(delegation_error_code::unauthorized));
  EXPECT_TRUE(fixture.store().get_active(delegation_fixture::signer('A')));
}

TEST(delegation_lifecycle, revoke_twice_reports_no_active_delegation) {
  auto fixture = delegation_fixture{};
  auto a = delegation_fixture::signer('A');
  ASSERT_EQ(fixture.create('A', 'B').code, 0u);

  auto first = fixture.lifecycle().revoke(a, a, 20);
  ASSERT_EQ(first.code, 0u);
  EXPECT_EQ(first.codespace, "mandate.revoke");
  ASSERT_EQ(first.events.size(), 1u);
  EXPECT_EQ(first.events[0].type, delegation_event_type_t::revoked);

  auto history = fixture.store().get_history(a);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].ended_reason,
            std::optional<end_reason_t>{end_reason_t::revoked});
  EXPECT_EQ(history[0].ended_at, std::optional<ledger_time_t>{20});

  auto second = fixture.lifecycle().revoke(a, a, 21);
  EXPECT_EQ(second.code, code_of(delegation_error_code::no_active_delegation));
}

TEST(delegation_lifecycle, revoking_an_expired_edge_changes_nothing) {
  auto fixture = delegation_fixture{};
  auto a = delegation_fixture::signer('A');
  ASSERT_EQ(fixture.create('A', 'B', 10, 50).code, 0u);
  auto before = delegation_record_count(fixture);

  EXPECT_EQ(fixture.lifecycle().revoke(a, a, 50).code,
            code_of(delegation_error_code::no_active_delegation));
  EXPECT_EQ(delegation_record_count(fixture), before);
  EXPECT_EQ(fixture.store().get_history(a).size(), 1u);
}
