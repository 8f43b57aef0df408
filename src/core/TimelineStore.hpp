#pragma once
#include "models/SegmentModel.hpp"
#include <vector>

// Durable home for finalized segments. Wire it to MySQL or any other layer.
class TimelineStore {
public:
  virtual ~TimelineStore() = default;
  virtual void begin() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;

  // Insert or update a finalized segment (idempotent by id)
  virtual void upsert_segment(const Segment &segment) = 0;

  // Highest segment id ever stored, 0 when empty.
  virtual SegmentId max_segment_id() = 0;

  // Segments overlapping [from, to], ascending by start.
  // Default: return empty; concrete stores can override when ready.
  virtual std::vector<Segment> query_segments_between(double from,
                                                      double to) {
    return {};
  }
};
