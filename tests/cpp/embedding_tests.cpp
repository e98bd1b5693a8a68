#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "balancer/core/audit.hpp"
#include "balancer/core/balancer.hpp"
#include "balancer/core/embedding.hpp"
#include "balancer/core/error.hpp"
#include "test_utils.hpp"

using namespace balancer::core;
using namespace balancer::core::test;

TEST(Splice, MapsEndpointsAndPrefixesDevices) {
  std::vector<Flow> in {60}, out {30, 30};
  auto fragment = design_balancer(in, out);

  GraphBuilder host;
  splice(host, fragment, EmbedMapping{"iron_", {"Miner1"}, {"Smelter1", "Smelter2"}});
  auto g = std::move(host).finish();

  EXPECT_EQ(g.num_nodes(), 4);
  EXPECT_TRUE(g.find("iron_S0").has_value());
  EXPECT_FALSE(g.find("S0").has_value());
  EXPECT_EQ(edge_strings(g), (std::vector<std::string>{
      "Miner1->iron_S0:60", "iron_S0->Smelter1:30", "iron_S0->Smelter2:30"}));
  EXPECT_EQ(g.node(*g.find("Miner1")).kind, NodeKind::Input);
  EXPECT_EQ(g.node(*g.find("Miner1")).rate, 60);
}

TEST(Splice, ReusesExistingHostNodes) {
  std::vector<Flow> iron_in {60}, iron_out {30, 30};
  std::vector<Flow> copper_in {30, 30}, copper_out {60};

  GraphBuilder host;
  splice(host, design_balancer(iron_in, iron_out), EmbedMapping{"iron_", {"Miner1"}, {"Smelter1", "Smelter2"}});
  splice(host, design_balancer(copper_in, copper_out),
         EmbedMapping{"copper_", {"MinerA", "MinerB"}, {"Smelter1"}});
  auto g = std::move(host).finish();

  EXPECT_EQ(g.num_nodes(), 7);
  EXPECT_EQ(g.num_edges(), 6);
  EXPECT_EQ(g.inflow(*g.find("Smelter1")), 90);
  EXPECT_TRUE(has_edge(g, "copper_M0", "Smelter1"));
  EXPECT_EQ(g.num_inputs(), 3);
  EXPECT_EQ(g.num_outputs(), 2);
  EXPECT_EQ(g.node(*g.find("Smelter1")).rate, 90);
  EXPECT_EQ(g.node(*g.find("Smelter2")).rate, 30);
  EXPECT_TRUE(audit_network(g).empty());
}

TEST(Splice, SharedInputAccumulatesRate) {
  // One miner feeds two separate balancers.
  std::vector<Flow> a_in {40}, a_out {20, 20};
  std::vector<Flow> b_in {50}, b_out {25, 25};
  GraphBuilder host;
  splice(host, design_balancer(a_in, a_out), EmbedMapping{"a_", {"Miner"}, {"A1", "A2"}});
  splice(host, design_balancer(b_in, b_out), EmbedMapping{"b_", {"Miner"}, {"B1", "B2"}});
  auto g = std::move(host).finish();
  EXPECT_EQ(g.num_inputs(), 1);
  EXPECT_EQ(g.node(*g.find("Miner")).rate, 90);
  EXPECT_EQ(g.outflow(*g.find("Miner")), 90);
  EXPECT_TRUE(audit_network(g).empty());
}

TEST(Splice, EmptyIdListsKeepFragmentIds) {
  std::vector<Flow> in {100}, out {100};
  GraphBuilder host;
  splice(host, design_balancer(in, out), EmbedMapping{});
  auto g = std::move(host).finish();
  EXPECT_EQ(edge_strings(g), (std::vector<std::string>{"I0->O0:100"}));
}

TEST(Splice, DeviceCollisionThrows) {
  std::vector<Flow> in {60}, out {30, 30};
  auto fragment = design_balancer(in, out);
  GraphBuilder host;
  splice(host, fragment, EmbedMapping{"x_", {}, {}});
  EXPECT_THROW(splice(host, fragment, EmbedMapping{"x_", {}, {}}), ValueError);
  EXPECT_EQ(host.num_nodes(), 4);
  EXPECT_EQ(host.node(*host.find("I0")).rate, 60);
}

TEST(Splice, FailedSpliceLeavesHostUnchanged) {
  std::vector<Flow> in {60}, out {30, 30};
  auto fragment = design_balancer(in, out);
  GraphBuilder host;
  splice(host, fragment, EmbedMapping{"x_", {"A"}, {"B", "C"}});
  ASSERT_EQ(host.num_nodes(), 4);
  ASSERT_EQ(host.num_edges(), 3);

  // Fresh endpoint ids, but the device prefix collides with the first splice.
  EXPECT_THROW(splice(host, fragment, EmbedMapping{"x_", {"D"}, {"E", "F"}}), ValueError);
  EXPECT_EQ(host.num_nodes(), 4);
  EXPECT_EQ(host.num_edges(), 3);
  EXPECT_FALSE(host.find("D").has_value());

  // Reused endpoint plus a colliding device: the reused rate is not bumped.
  EXPECT_THROW(splice(host, fragment, EmbedMapping{"x_", {"A"}, {"E", "F"}}), ValueError);
  EXPECT_EQ(host.node(*host.find("A")).rate, 60);
  EXPECT_EQ(host.num_nodes(), 4);
}

TEST(Splice, EndpointKindMismatchThrows) {
  std::vector<Flow> in {60}, out {30, 30};
  auto fragment = design_balancer(in, out);
  GraphBuilder host;
  splice(host, fragment, EmbedMapping{"x_", {"A"}, {"B", "C"}});
  // "B" is an output in the host; mapping an input onto it is rejected.
  EXPECT_THROW(splice(host, fragment, EmbedMapping{"y_", {"B"}, {"E", "F"}}), ValueError);
  // The same id used as both input and output within one fragment.
  EXPECT_THROW(splice(host, fragment, EmbedMapping{"z_", {"G"}, {"G", "H"}}), ValueError);
  // A device id of the host cannot serve as an endpoint.
  EXPECT_THROW(splice(host, fragment, EmbedMapping{"w_", {"x_S0"}, {"E", "F"}}), ValueError);
  EXPECT_THROW(splice(host, fragment, EmbedMapping{"v_", {""}, {"E", "F"}}), std::invalid_argument);
  EXPECT_EQ(host.num_nodes(), 4);
}

TEST(Splice, WrongIdCountThrows) {
  std::vector<Flow> in {60}, out {30, 30};
  auto fragment = design_balancer(in, out);
  GraphBuilder host;
  EXPECT_THROW(splice(host, fragment, EmbedMapping{"x_", {"A", "B"}, {}}), std::invalid_argument);
  EXPECT_THROW(splice(host, fragment, EmbedMapping{"x_", {}, {"only_one"}}), std::invalid_argument);
  EXPECT_EQ(host.num_nodes(), 0);
}
