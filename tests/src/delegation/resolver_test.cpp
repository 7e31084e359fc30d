#include <gtest/gtest.h>
#include <mandate/delegation/resolver.hpp>
#include <mandate/testing/common.hpp>

#include <map>
#include <optional>

using namespace mandate::schema;
using mandate::delegation::kMaxDelegationDepth;
using mandate::delegation::resolve;
using mandate::testing::make_named_signer;

namespace {

/// Edges held in a plain map so the resolver can be fed graphs the lifecycle
/// manager would never write.
class edge_map final {
 public:
  void add(const char delegator,
           const char delegate,
           std::optional<ledger_time_t> expiry = std::nullopt) {
    auto edge = delegation_edge_t{};
    edge.delegation_id = ++next_id_;
    edge.delegator = signer(delegator);
    edge.delegate = signer(delegate);
    edge.expiry = expiry;
    edge.active = true;
    edges_[edge.delegator] = edge;
  }

  mandate::delegation::edge_lookup_t lookup() const {
    return [this](const signer_id_t& delegator) {
      auto it = edges_.find(delegator);
      return it == edges_.end() ? std::nullopt
                                : std::optional<delegation_edge_t>{it->second};
    };
  }

  static signer_id_t signer(const char name) {
    return make_named_signer(static_cast<uint8_t>(name));
  }

 private:
  std::map<signer_id_t, delegation_edge_t> edges_;
  delegation_id_t next_id_{};
};

}  // namespace

TEST(resolver, undelegated_signer_votes_for_itself) {
  auto edges = edge_map{};
  auto resolution =
      resolve(edge_map::signer('A'), 10, kMaxDelegationDepth, edges.lookup());
  ASSERT_TRUE(resolution.has_value());
  EXPECT_EQ(resolution->effective_voter, edge_map::signer('A'));
  EXPECT_EQ(resolution->hops, 0u);
  EXPECT_EQ(resolution->path.size(), 1u);
}

TEST(resolver, follows_chain_to_terminal_signer) {
  auto edges = edge_map{};
  edges.add('A', 'B');
  edges.add('B', 'C');
  auto resolution =
      resolve(edge_map::signer('A'), 10, kMaxDelegationDepth, edges.lookup());
  ASSERT_TRUE(resolution.has_value());
  EXPECT_EQ(resolution->effective_voter, edge_map::signer('C'));
  EXPECT_EQ(resolution->hops, 2u);
  EXPECT_EQ(resolution->path,
            (std::vector<signer_id_t>{edge_map::signer('A'),
                                      edge_map::signer('B'),
                                      edge_map::signer('C')}));
  EXPECT_FALSE(resolution->depth_capped);
}

TEST(resolver, stale_edge_ends_the_walk) {
  auto edges = edge_map{};
  edges.add('A', 'B');
  edges.add('B', 'C', 50);
  auto before = resolve(edge_map::signer('A'), 49, kMaxDelegationDepth,
                        edges.lookup());
  auto at = resolve(edge_map::signer('A'), 50, kMaxDelegationDepth,
                    edges.lookup());
  ASSERT_TRUE(before.has_value());
  ASSERT_TRUE(at.has_value());
  EXPECT_EQ(before->effective_voter, edge_map::signer('C'));
  EXPECT_EQ(at->effective_voter, edge_map::signer('B'));
  EXPECT_EQ(at->hops, 1u);
}

TEST(resolver, cycle_is_reported_instead_of_looping) {
  auto edges = edge_map{};
  edges.add('A', 'B');
  edges.add('B', 'C');
  edges.add('C', 'A');
  EXPECT_FALSE(resolve(edge_map::signer('A'), 10, kMaxDelegationDepth,
                       edges.lookup())
                   .has_value());
}

TEST(resolver, walk_stops_at_the_depth_ceiling) {
  auto edges = edge_map{};
  edges.add('A', 'B');
  edges.add('B', 'C');
  edges.add('C', 'D');
  edges.add('D', 'E');
  auto resolution =
      resolve(edge_map::signer('A'), 10, kMaxDelegationDepth, edges.lookup());
  ASSERT_TRUE(resolution.has_value());
  EXPECT_EQ(resolution->hops, kMaxDelegationDepth);
  EXPECT_EQ(resolution->effective_voter, edge_map::signer('D'));
  EXPECT_TRUE(resolution->depth_capped);
}
