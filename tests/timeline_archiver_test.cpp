#include <gtest/gtest.h>

#include "core/DefaultScoringPolicy.hpp"
#include "core/TimelineArchiver.hpp"
#include "core/TimelineManager.hpp"
#include "support/ChainBuilder.hpp"
#include "support/FakeScoringPolicy.hpp"
#include "support/MemoryTimelineStore.hpp"

namespace {

Segment Closed(SegmentId id, double start, double end) {
  Segment s;
  s.id = id;
  s.start = start;
  s.end = end;
  s.samples = {MakeSample(start, MovingState::Moving),
               MakeSample(end, MovingState::Moving)};
  return s;
}

// Walk, stay, walk, stay from `t0`; each leg long enough to be kept.
// Returns the time after the last sample.
double RecordCommute(TimelineManager &manager, double t0) {
  double t = t0;
  double lat = 51.5;
  for (int leg = 0; leg < 4; ++leg) {
    const bool moving = leg % 2 == 0;
    for (int i = 0; i < 30; ++i, t += 10) {
      if (moving)
        lat += 0.001;
      manager.submit(MakeSample(
          t, moving ? MovingState::Moving : MovingState::Stationary, lat,
          -0.1));
    }
  }
  return t;
}

TimelineParams OneHertzParams() {
  TimelineParams params;
  params.samples_per_minute = 60;
  return params;
}

} // namespace

TEST(TimelineArchiverTest, WritesBatchInOneTransaction) {
  MemoryTimelineStore store;
  TimelineArchiver archiver(store);

  archiver.onSegmentsFinalized({Closed(1, 0, 10), Closed(2, 10, 20)});

  EXPECT_EQ(store.rows.size(), 2u);
  EXPECT_EQ(store.commits, 1);
  EXPECT_EQ(archiver.archivedCount(), 2u);
  EXPECT_EQ(archiver.failedBatches(), 0u);
}

TEST(TimelineArchiverTest, EmptyBatchDoesNotTouchStore) {
  MemoryTimelineStore store;
  TimelineArchiver archiver(store);
  archiver.onSegmentsFinalized({});
  EXPECT_EQ(store.commits, 0);
}

TEST(TimelineArchiverTest, FailedBatchIsRolledBack) {
  MemoryTimelineStore store;
  store.fail_on = 2;
  TimelineArchiver archiver(store);

  archiver.onSegmentsFinalized({Closed(1, 0, 10), Closed(2, 10, 20)});

  EXPECT_TRUE(store.rows.empty());
  EXPECT_EQ(store.rollbacks, 1);
  EXPECT_FALSE(store.in_tx);
  EXPECT_EQ(archiver.failedBatches(), 1u);
  EXPECT_EQ(archiver.archivedCount(), 0u);

  // the next batch goes through
  store.fail_on.reset();
  archiver.onSegmentsFinalized({Closed(3, 20, 30)});
  EXPECT_EQ(store.rows.size(), 1u);
}

TEST(TimelineArchiverTest, ArchivesWhatTheManagerFinalizes) {
  MemoryTimelineStore store;
  TimelineArchiver archiver(store);
  DefaultScoringPolicy policy;
  TimelineManager manager(policy, OneHertzParams());
  manager.addObserver(&archiver);
  manager.startRecording();

  const double t = RecordCommute(manager, 0);

  auto finalized = manager.finalizedSegments();
  ASSERT_FALSE(finalized.empty());
  EXPECT_EQ(archiver.archivedCount(), finalized.size());
  for (const auto &seg : finalized) {
    ASSERT_EQ(store.rows.count(seg.id), 1u);
    EXPECT_EQ(store.rows.at(seg.id).samples.size(), seg.samples.size());
  }

  auto history = store.query_segments_between(0, t);
  EXPECT_EQ(history.size(), finalized.size());
}

TEST(TimelineArchiverTest, RestartedEngineDoesNotOverwriteHistory) {
  MemoryTimelineStore store;
  DefaultScoringPolicy policy;

  std::size_t first_run = 0;
  {
    TimelineArchiver archiver(store);
    TimelineManager manager(policy, OneHertzParams(),
                            store.max_segment_id() + 1);
    manager.addObserver(&archiver);
    manager.startRecording();
    RecordCommute(manager, 0);
    first_run = store.rows.size();
  }
  ASSERT_GT(first_run, 0u);
  const auto before = store.rows;

  TimelineArchiver archiver(store);
  TimelineManager manager(policy, OneHertzParams(),
                          store.max_segment_id() + 1);
  manager.addObserver(&archiver);
  manager.startRecording();
  RecordCommute(manager, 100000);

  ASSERT_GT(archiver.archivedCount(), 0u);
  EXPECT_EQ(store.rows.size(), first_run + archiver.archivedCount());
  for (const auto &kv : before) {
    ASSERT_EQ(store.rows.count(kv.first), 1u);
    EXPECT_DOUBLE_EQ(store.rows.at(kv.first).start, kv.second.start);
  }
}

TEST(TimelineArchiverTest, RelinkedFinalizedSegmentIsRewritten) {
  MemoryTimelineStore store;
  TimelineArchiver archiver(store);
  FakeScoringPolicy policy;
  TimelineManager manager(policy, OneHertzParams());
  manager.addObserver(&archiver);
  manager.startRecording();

  manager.submit(MakeSample(0, MovingState::Moving));
  manager.submit(MakeSample(1, MovingState::Stationary));
  manager.submit(MakeSample(2, MovingState::Moving));
  ASSERT_EQ(store.rows.size(), 1u);
  const Segment archived = store.rows.begin()->second;
  const SegmentId visit = *archived.next;
  const SegmentId path = manager.currentSegment()->id;

  // the newest path swallows the visit next to the archived segment
  policy.scorer = [path, visit](const Segment &keeper, const Segment &deadman,
                                const Segment *) {
    return keeper.id == path && deadman.id == visit ? MergeScore::High
                                                    : MergeScore::Impossible;
  };
  manager.submit(MakeSample(3, MovingState::Moving));

  EXPECT_EQ(store.rows.at(archived.id).next, path);
  EXPECT_EQ(store.rows.count(visit), 0u);
  EXPECT_EQ(archiver.rewrittenCount(), 1u);
  EXPECT_EQ(archiver.failedBatches(), 0u);
}
