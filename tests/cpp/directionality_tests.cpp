/**
 * Tests for orienting an undirected river network towards its outlet.
 */

#include <gtest/gtest.h>
#include <cmath>
#include "riverconn/core/directionality.hpp"
#include "riverconn/core/error.hpp"
#include "test_utils.hpp"

using namespace riverconn::core;
using namespace riverconn::core::test;

namespace {

// Reference network with every second link stored against the flow.
RiverNetwork scrambled_reference() {
  auto ref = make_reference_network();
  std::vector<ReachId> from(ref.link_from_view().begin(), ref.link_from_view().end());
  std::vector<ReachId> to(ref.link_to_view().begin(), ref.link_to_view().end());
  for (std::size_t l = 0; l < from.size(); l += 2) std::swap(from[l], to[l]);
  auto net = RiverNetwork::from_arrays(ref.num_reaches(), from, to, ref.link_type_view());
  net.set_reach_labels(ref.reach_labels());
  net.set_barrier_ids(ref.barrier_ids());
  for (auto const& name : ref.reach_attribute_names()) {
    auto col = ref.reach_attribute(name);
    net.set_reach_attribute(name, {col.begin(), col.end()});
  }
  for (auto const& name : ref.link_attribute_names()) {
    auto col = ref.link_attribute(name);
    net.set_link_attribute(name, {col.begin(), col.end()});
  }
  return net;
}

} // namespace

TEST(Directionality, RecoversFlowDirectionFromOutlet) {
  auto ref = make_reference_network();
  auto oriented = orient_towards_outlet(scrambled_reference(), reach_of("16"));

  ASSERT_EQ(oriented.num_links(), ref.num_links());
  for (std::size_t l = 0; l < static_cast<std::size_t>(ref.num_links()); ++l) {
    EXPECT_EQ(oriented.link_from_view()[l], ref.link_from_view()[l]) << "link " << l;
    EXPECT_EQ(oriented.link_to_view()[l], ref.link_to_view()[l]) << "link " << l;
  }
}

TEST(Directionality, PreservesLinkDataAndLabels) {
  auto ref = make_reference_network();
  auto oriented = orient_towards_outlet(scrambled_reference(), reach_of("16"));

  EXPECT_EQ(oriented.reach_labels(), ref.reach_labels());
  EXPECT_EQ(oriented.barrier_ids(), ref.barrier_ids());
  for (std::size_t l = 0; l < static_cast<std::size_t>(ref.num_links()); ++l) {
    EXPECT_EQ(oriented.link_type_view()[l], ref.link_type_view()[l]);
    const double a = oriented.link_attribute("pass_u")[l];
    const double b = ref.link_attribute("pass_u")[l];
    EXPECT_TRUE((std::isnan(a) && std::isnan(b)) || a == b);
  }
  EXPECT_DOUBLE_EQ(oriented.reach_attribute("HSI")[static_cast<std::size_t>(reach_of("8"))], 0.7);
}

TEST(Directionality, OutletInTheMiddleOfALine) {
  auto net = make_confluence_line({1.0, 1.0, 1.0, 1.0, 1.0});
  auto oriented = orient_towards_outlet(net, 2);
  // Links 0-1, 1-2 keep pointing to 2; links 2-3, 3-4 are flipped towards 2.
  EXPECT_EQ(oriented.link_from_view()[0], 0);
  EXPECT_EQ(oriented.link_to_view()[0], 1);
  EXPECT_EQ(oriented.link_from_view()[1], 1);
  EXPECT_EQ(oriented.link_to_view()[1], 2);
  EXPECT_EQ(oriented.link_from_view()[2], 3);
  EXPECT_EQ(oriented.link_to_view()[2], 2);
  EXPECT_EQ(oriented.link_from_view()[3], 4);
  EXPECT_EQ(oriented.link_to_view()[3], 3);
}

TEST(Directionality, UnreachableComponentKeepsOrientation) {
  std::vector<ReachId> from = {0, 2};
  std::vector<ReachId> to = {1, 3};
  std::vector<LinkType> type = {LinkType::Confluence, LinkType::Confluence};
  auto net = RiverNetwork::from_arrays(4, from, to, type);
  auto oriented = orient_towards_outlet(net, 0);
  EXPECT_EQ(oriented.link_from_view()[0], 1);
  EXPECT_EQ(oriented.link_to_view()[0], 0);
  EXPECT_EQ(oriented.link_from_view()[1], 2);
  EXPECT_EQ(oriented.link_to_view()[1], 3);
}

TEST(Directionality, OutletOutOfRange) {
  auto net = make_confluence_line({1.0, 1.0});
  EXPECT_THROW((void)orient_towards_outlet(net, 2), InvalidParameter);
  EXPECT_THROW((void)orient_towards_outlet(net, -1), InvalidParameter);
}
