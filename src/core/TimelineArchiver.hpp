#pragma once
#include "core/TimelineObserver.hpp"
#include "core/TimelineStore.hpp"
#include <cstddef>

// Writes each batch of finalized segments to a TimelineStore in one
// transaction. Finalized segments relinked by a later merge are written
// again. A failed batch is rolled back, logged and counted; the engine keeps
// running.
class TimelineArchiver final : public TimelineObserver {
public:
  explicit TimelineArchiver(TimelineStore &store) : store_(store) {}

  void onSegmentsFinalized(const std::vector<Segment> &segments) override;
  void onSegmentsRelinked(const std::vector<Segment> &segments) override;

  std::size_t archivedCount() const noexcept { return archived_; }
  std::size_t rewrittenCount() const noexcept { return rewritten_; }
  std::size_t failedBatches() const noexcept { return failed_; }

private:
  TimelineStore &store_;
  std::size_t archived_ = 0;
  std::size_t rewritten_ = 0;
  std::size_t failed_ = 0;

  bool persist(const std::vector<Segment> &segments);
};
