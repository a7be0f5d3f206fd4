/**
 * Tests for RiverNetwork construction, attribute storage and incidence.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "riverconn/core/error.hpp"
#include "riverconn/core/river_network.hpp"
#include "test_utils.hpp"

using namespace riverconn::core;
using namespace riverconn::core::test;

TEST(RiverNetwork, FromArraysKeepsLinksAsGiven) {
  std::vector<ReachId> from = {2, 0};
  std::vector<ReachId> to = {1, 1};
  std::vector<LinkType> type = {LinkType::Barrier, LinkType::Confluence};
  auto net = RiverNetwork::from_arrays(3, from, to, type);

  EXPECT_EQ(net.num_reaches(), 3);
  EXPECT_EQ(net.num_links(), 2);
  EXPECT_EQ(net.link_from_view()[0], 2);
  EXPECT_EQ(net.link_to_view()[0], 1);
  EXPECT_EQ(net.link_type_view()[0], LinkType::Barrier);
  EXPECT_EQ(net.link_type_view()[1], LinkType::Confluence);
}

TEST(RiverNetwork, DefaultLabelsAndBarrierIds) {
  auto net = make_confluence_line({1.0, 1.0, 1.0});
  ASSERT_EQ(net.reach_labels().size(), 3u);
  EXPECT_EQ(net.reach_labels()[0], "0");
  EXPECT_EQ(net.reach_labels()[2], "2");
  ASSERT_EQ(net.barrier_ids().size(), 2u);
  EXPECT_TRUE(net.barrier_ids()[0].empty());
}

TEST(RiverNetwork, RejectsInvalidArrays) {
  std::vector<ReachId> from = {0};
  std::vector<ReachId> to = {3};
  std::vector<LinkType> type = {LinkType::Confluence};
  EXPECT_THROW((void)RiverNetwork::from_arrays(3, from, to, type), std::out_of_range);

  std::vector<ReachId> self = {1};
  EXPECT_THROW((void)RiverNetwork::from_arrays(3, self, self, type), std::invalid_argument);

  std::vector<ReachId> to2 = {1, 2};
  EXPECT_THROW((void)RiverNetwork::from_arrays(3, from, to2, type), std::invalid_argument);
  EXPECT_THROW((void)RiverNetwork::from_arrays(-1, {}, {}, {}), std::invalid_argument);
}

TEST(RiverNetwork, EmptyNetwork) {
  auto net = RiverNetwork::from_arrays(0, {}, {}, {});
  EXPECT_EQ(net.num_reaches(), 0);
  EXPECT_EQ(net.num_links(), 0);
  ASSERT_EQ(net.incident_offsets_view().size(), 1u);
}

TEST(RiverNetwork, AttributeLengthIsChecked) {
  auto net = make_confluence_line({1.0, 2.0});
  EXPECT_THROW(net.set_reach_attribute("hsi", {1.0}), std::invalid_argument);
  EXPECT_THROW(net.set_link_attribute("pass_u", {1.0, 1.0}), std::invalid_argument);
  EXPECT_THROW(net.set_reach_labels({"a"}), std::invalid_argument);
  EXPECT_THROW(net.set_barrier_ids({}), std::invalid_argument);
}

TEST(RiverNetwork, AttributeLookup) {
  auto net = make_dammed_line();
  EXPECT_TRUE(net.has_reach_attribute("length"));
  EXPECT_FALSE(net.has_reach_attribute("pass_u"));
  EXPECT_TRUE(net.has_link_attribute("pass_u"));

  auto len = net.reach_attribute("length");
  ASSERT_EQ(len.size(), 3u);
  EXPECT_DOUBLE_EQ(len[1], 2.0);

  auto pu = net.link_attribute("pass_u");
  EXPECT_DOUBLE_EQ(pu[0], 0.5);
  EXPECT_TRUE(std::isnan(pu[1]));

  EXPECT_THROW((void)net.reach_attribute("HSI"), InvalidAttribute);
  EXPECT_THROW((void)net.link_attribute("length"), InvalidAttribute);

  auto names = net.reach_attribute_names();
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "length");
  EXPECT_EQ(names[1], "w");
}

TEST(RiverNetwork, SettingAnAttributeTwiceReplacesIt) {
  auto net = make_confluence_line({1.0, 2.0});
  net.set_reach_attribute("length", {5.0, 6.0});
  EXPECT_DOUBLE_EQ(net.reach_attribute("length")[0], 5.0);
  EXPECT_EQ(net.reach_attribute_names().size(), 1u);
}

TEST(RiverNetwork, LinksOfBarrier) {
  auto net = make_reference_network();
  auto links = net.links_of_barrier("4");
  ASSERT_EQ(links.size(), 1u);
  EXPECT_EQ(net.link_from_view()[static_cast<std::size_t>(links[0])], reach_of("7"));
  EXPECT_EQ(net.link_to_view()[static_cast<std::size_t>(links[0])], reach_of("10"));
  EXPECT_TRUE(net.links_of_barrier("99").empty());
  EXPECT_TRUE(net.links_of_barrier("").empty());
}

TEST(RiverNetwork, BarrierIdOnConfluenceIsNotABarrier) {
  auto net = make_confluence_line({1.0, 1.0});
  net.set_barrier_ids({"X"});
  EXPECT_TRUE(net.links_of_barrier("X").empty());
}

TEST(RiverNetwork, IncidenceIsUndirectedAndSorted) {
  auto net = make_reference_network();
  auto off = net.incident_offsets_view();
  auto nbr = net.incident_reach_view();
  auto lnk = net.incident_link_view();
  ASSERT_EQ(off.size(), 17u);
  EXPECT_EQ(off.back(), 2 * net.num_links());

  // Reach "12" meets "11", "13" and "14".
  const auto v = static_cast<std::size_t>(reach_of("12"));
  ASSERT_EQ(off[v + 1] - off[v], 3);
  for (auto p = static_cast<std::size_t>(off[v]); p + 1 < static_cast<std::size_t>(off[v + 1]); ++p) {
    EXPECT_LT(nbr[p], nbr[p + 1]);
  }
  for (auto p = static_cast<std::size_t>(off[v]); p < static_cast<std::size_t>(off[v + 1]); ++p) {
    const auto l = static_cast<std::size_t>(lnk[p]);
    const bool touches = net.link_from_view()[l] == static_cast<ReachId>(v) ||
                         net.link_to_view()[l] == static_cast<ReachId>(v);
    EXPECT_TRUE(touches);
  }
}
