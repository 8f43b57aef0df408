#include <gtest/gtest.h>

#include "core/SegmentBuilder.hpp"
#include "support/ChainBuilder.hpp"
#include <memory>

class SegmentBuilderTest : public ::testing::Test {
protected:
  void SetUp() override {
    params_.samples_per_minute = 60; // one sample per second
    builder_ = std::make_unique<SegmentBuilder>(chain_, params_);
  }

  TimelineParams params_;
  TimelineChain chain_;
  std::unique_ptr<SegmentBuilder> builder_;
};

TEST_F(SegmentBuilderTest, FirstSampleOpensSegmentOfMatchingKind) {
  auto r = builder_->add(MakeSample(0, MovingState::Uncertain));
  EXPECT_EQ(r.outcome, SegmentBuilder::Outcome::Created);

  const Segment *current = chain_.current();
  ASSERT_NE(current, nullptr);
  EXPECT_EQ(current->id, r.segment);
  EXPECT_EQ(current->kind, SegmentKind::Path);
  EXPECT_DOUBLE_EQ(current->start, 0.0);
  EXPECT_FALSE(current->end.has_value());
  EXPECT_FALSE(current->previous.has_value());
}

TEST_F(SegmentBuilderTest, StationaryOpensVisit) {
  builder_->add(MakeSample(0, MovingState::Stationary));
  ASSERT_NE(chain_.current(), nullptr);
  EXPECT_EQ(chain_.current()->kind, SegmentKind::Visit);
}

TEST_F(SegmentBuilderTest, CompatibleSamplesAppendToCurrent) {
  auto first = builder_->add(MakeSample(0, MovingState::Moving));
  auto second = builder_->add(MakeSample(1, MovingState::Uncertain));
  auto third = builder_->add(MakeSample(2, MovingState::Moving));

  EXPECT_EQ(second.outcome, SegmentBuilder::Outcome::Appended);
  EXPECT_EQ(third.outcome, SegmentBuilder::Outcome::Appended);
  EXPECT_EQ(second.segment, first.segment);
  EXPECT_EQ(chain_.activeCount(), 1u);
  EXPECT_EQ(chain_.current()->samples.size(), 3u);
}

TEST_F(SegmentBuilderTest, StateChangeClosesAndLinks) {
  auto path = builder_->add(MakeSample(0, MovingState::Moving));
  builder_->add(MakeSample(1, MovingState::Moving));
  auto visit = builder_->add(MakeSample(2, MovingState::Stationary));

  ASSERT_EQ(visit.outcome, SegmentBuilder::Outcome::Created);
  ASSERT_EQ(chain_.activeCount(), 2u);

  const Segment &closed = chain_.at(path.segment);
  const Segment &open = chain_.at(visit.segment);
  ASSERT_TRUE(closed.end.has_value());
  EXPECT_DOUBLE_EQ(*closed.end, 1.0);
  EXPECT_EQ(closed.next, open.id);
  EXPECT_EQ(open.previous, closed.id);
  EXPECT_EQ(chain_.current(), &open);
  EXPECT_TRUE(chain_.verifyActive());
}

TEST_F(SegmentBuilderTest, RateLimitedSampleIsIgnored) {
  builder_->add(MakeSample(10, MovingState::Moving));
  auto r = builder_->add(MakeSample(10.5, MovingState::Stationary));

  EXPECT_EQ(r.outcome, SegmentBuilder::Outcome::RateLimited);
  EXPECT_EQ(chain_.activeCount(), 1u);
  EXPECT_EQ(chain_.current()->samples.size(), 1u);
  ASSERT_TRUE(builder_->lastAccepted().has_value());
  EXPECT_DOUBLE_EQ(*builder_->lastAccepted(), 10.0);

  // exactly the minimum spacing is accepted
  r = builder_->add(MakeSample(11, MovingState::Moving));
  EXPECT_EQ(r.outcome, SegmentBuilder::Outcome::Appended);
}

TEST_F(SegmentBuilderTest, SpacingFollowsSamplesPerMinute) {
  params_.samples_per_minute = 10; // six seconds apart
  builder_->add(MakeSample(0, MovingState::Moving));
  EXPECT_EQ(builder_->add(MakeSample(5, MovingState::Moving)).outcome,
            SegmentBuilder::Outcome::RateLimited);
  EXPECT_EQ(builder_->add(MakeSample(6, MovingState::Moving)).outcome,
            SegmentBuilder::Outcome::Appended);
}

TEST(ContinuationTableTest, PathAndVisitContinuation) {
  EXPECT_TRUE(ContinuesOn(SegmentKind::Path, MovingState::Moving));
  EXPECT_TRUE(ContinuesOn(SegmentKind::Path, MovingState::Uncertain));
  EXPECT_FALSE(ContinuesOn(SegmentKind::Path, MovingState::Stationary));
  EXPECT_FALSE(ContinuesOn(SegmentKind::Visit, MovingState::Moving));
  EXPECT_FALSE(ContinuesOn(SegmentKind::Visit, MovingState::Uncertain));
  EXPECT_TRUE(ContinuesOn(SegmentKind::Visit, MovingState::Stationary));
}
