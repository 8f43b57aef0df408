#include <gtest/gtest.h>

#include "core/TimelineChain.hpp"
#include "support/ChainBuilder.hpp"

TEST(TimelineChainTest, OpenSegmentLinksAfterLastActive) {
  TimelineChain chain;
  auto a = AddSegment(chain, SegmentKind::Path, {0, 1});
  auto b = AddSegment(chain, SegmentKind::Visit, {2, 3});

  EXPECT_EQ(chain.at(a).next, b);
  EXPECT_EQ(chain.at(b).previous, a);
  EXPECT_NE(a, b);
  EXPECT_EQ(chain.current()->id, b);
  EXPECT_TRUE(chain.verifyActive());
}

TEST(TimelineChainTest, CurrentIsNullWhenLastSegmentClosed) {
  TimelineChain chain;
  auto a = AddSegment(chain, SegmentKind::Path, {0});
  chain.at(a).end = 0.0;
  EXPECT_EQ(chain.current(), nullptr);
}

TEST(TimelineChainTest, PromoteMovesPrefixInOrder) {
  TimelineChain chain;
  auto a = AddSegment(chain, SegmentKind::Path, {0});
  auto b = AddSegment(chain, SegmentKind::Visit, {1});
  auto c = AddSegment(chain, SegmentKind::Path, {2});

  auto moved = chain.promoteOldest(2);
  EXPECT_EQ(moved, (std::vector<SegmentId>{a, b}));
  EXPECT_EQ(chain.finalizedIds(), (std::vector<SegmentId>{a, b}));
  EXPECT_EQ(chain.activeIds(), (std::vector<SegmentId>{c}));
  EXPECT_TRUE(chain.isFinalized(a));
  EXPECT_FALSE(chain.isActive(a));
  // the boundary link is kept
  EXPECT_EQ(chain.at(b).next, c);
  EXPECT_TRUE(chain.verifyActive());
  EXPECT_TRUE(chain.verifyFinalized());
}

TEST(TimelineChainTest, FindActiveIgnoresFinalized) {
  TimelineChain chain;
  auto a = AddSegment(chain, SegmentKind::Path, {0});
  auto b = AddSegment(chain, SegmentKind::Visit, {1});
  chain.promoteOldest(1);

  EXPECT_EQ(chain.findActive(chain.at(b).previous), nullptr);
  EXPECT_NE(chain.find(a), nullptr);
  EXPECT_EQ(chain.findActive(std::nullopt), nullptr);
}

TEST(TimelineChainTest, DiscardFinalizedRepairsNeighbourLinks) {
  TimelineChain chain;
  auto a = AddSegment(chain, SegmentKind::Path, {0});
  auto b = AddSegment(chain, SegmentKind::Visit, {1});
  auto c = AddSegment(chain, SegmentKind::Path, {2});
  chain.promoteOldest(2);

  auto gone = chain.discardFinalized(
      [b](const Segment &seg) { return seg.id == b; });
  EXPECT_EQ(gone, (std::vector<SegmentId>{b}));
  EXPECT_EQ(chain.find(b), nullptr);
  EXPECT_EQ(chain.finalizedIds(), (std::vector<SegmentId>{a}));
  EXPECT_FALSE(chain.at(a).next.has_value());
  EXPECT_FALSE(chain.at(c).previous.has_value());
}

TEST(TimelineChainTest, VerifyActiveReportsBrokenLink) {
  TimelineChain chain;
  auto a = AddSegment(chain, SegmentKind::Path, {0});
  AddSegment(chain, SegmentKind::Visit, {1});
  chain.at(a).next.reset();

  std::string why;
  EXPECT_FALSE(chain.verifyActive(&why));
  EXPECT_NE(why.find("broken link"), std::string::npos);
}

TEST(TimelineChainTest, VerifyActiveReportsOpenSegmentNotLast) {
  TimelineChain chain;
  auto a = AddSegment(chain, SegmentKind::Path, {0});
  AddSegment(chain, SegmentKind::Visit, {1});
  chain.at(a).end.reset();

  std::string why;
  EXPECT_FALSE(chain.verifyActive(&why));
  EXPECT_NE(why.find("not last"), std::string::npos);
}

TEST(TimelineChainTest, VerifyFinalizedRejectsOpenSegment) {
  TimelineChain chain;
  AddSegment(chain, SegmentKind::Path, {0});
  chain.promoteOldest(1);

  std::string why;
  EXPECT_FALSE(chain.verifyFinalized(&why));
  EXPECT_NE(why.find("open segment"), std::string::npos);
}

TEST(TimelineChainTest, IdsStartAtSeed) {
  TimelineChain chain(501);
  auto a = AddSegment(chain, SegmentKind::Path, {0});
  auto b = AddSegment(chain, SegmentKind::Visit, {1});
  EXPECT_EQ(a, 501u);
  EXPECT_EQ(b, 502u);
  EXPECT_THROW(TimelineChain(0), std::invalid_argument);
}

TEST(TimelineChainTest, AtThrowsForUnknownId) {
  TimelineChain chain;
  EXPECT_THROW(chain.at(42), std::out_of_range);
}
