// Ticket: 0001_edge_pair_contact_geometry

#include <gtest/gtest.h>

#include <set>
#include <utility>

#include "ric-sim/src/Contact/EdgePairIndex.hpp"

using namespace ric_sim;

// ============================================================================
// Construction
// ============================================================================

TEST(EdgePairIndex, CountMatchesClosedForm)
{
  for (size_t numEdges : {0u, 1u, 2u, 3u, 4u, 5u, 10u, 37u})
  {
    for (size_t ia : {0u, 1u, 2u, 3u})
    {
      EdgePairIndex index{numEdges, ia};
      size_t expected = 0;
      for (size_t i = 0; i < numEdges; ++i)
      {
        if (numEdges > i + ia + 1)
        {
          expected += numEdges - i - (ia + 1);
        }
      }
      EXPECT_EQ(index.size(), expected) << "numEdges=" << numEdges << " ia=" << ia;
      EXPECT_EQ(EdgePairIndex::countPairs(numEdges, ia), expected);
    }
  }
}

TEST(EdgePairIndex, ExcludesAdjacentEdges)
{
  EdgePairIndex index{12};
  for (const auto& pair : index)
  {
    EXPECT_LT(pair.first, pair.second);
    EXPECT_GT(pair.second - pair.first, EdgePairIndex::kDefaultIgnoreAdjacent);
  }
}

TEST(EdgePairIndex, ContainsEveryEligiblePairOnce)
{
  constexpr size_t kNumEdges{9};
  EdgePairIndex index{kNumEdges};

  std::set<std::pair<uint32_t, uint32_t>> seen;
  for (const auto& pair : index)
  {
    EXPECT_TRUE(seen.emplace(pair.first, pair.second).second);
  }

  for (uint32_t i = 0; i < kNumEdges; ++i)
  {
    for (uint32_t j = i + 3; j < kNumEdges; ++j)
    {
      EXPECT_TRUE(seen.contains({i, j})) << "missing (" << i << ", " << j << ")";
    }
  }
}

TEST(EdgePairIndex, GroupedByFirstEdgeAscending)
{
  EdgePairIndex index{8};
  ASSERT_EQ(index.size(), 15u);

  EXPECT_EQ(index[0], (EdgePair{0, 3}));
  EXPECT_EQ(index[1], (EdgePair{0, 4}));
  EXPECT_EQ(index[4], (EdgePair{0, 7}));
  EXPECT_EQ(index[5], (EdgePair{1, 4}));
  EXPECT_EQ(index[14], (EdgePair{4, 7}));

  for (size_t k = 1; k < index.size(); ++k)
  {
    const auto& prev = index[k - 1];
    const auto& cur = index[k];
    EXPECT_TRUE(prev.first < cur.first ||
                (prev.first == cur.first && prev.second < cur.second));
  }
}

TEST(EdgePairIndex, PairsForEdge_MatchesGroups)
{
  EdgePairIndex index{8};
  EXPECT_EQ(index.pairsForEdge(0), 5u);
  EXPECT_EQ(index.pairsForEdge(4), 1u);
  EXPECT_EQ(index.pairsForEdge(5), 0u);
  EXPECT_EQ(index.pairsForEdge(100), 0u);
}

// ============================================================================
// Degenerate sizes
// ============================================================================

TEST(EdgePairIndex, TooFewEdges_EmptyTable)
{
  EXPECT_TRUE(EdgePairIndex{0}.empty());
  EXPECT_TRUE(EdgePairIndex{1}.empty());
  EXPECT_TRUE(EdgePairIndex{3}.empty());
  EXPECT_EQ(EdgePairIndex{4}.size(), 1u);
}
