#pragma once
#include "models/SegmentModel.hpp"
#include <vector>

// Receives timeline events synchronously, in registration order. Callbacks
// must not submit samples back into the manager that raised them.
class TimelineObserver {
public:
  virtual ~TimelineObserver() = default;

  virtual void onSegmentCreated(const Segment &segment) {}
  virtual void onProcessingCompleted() {}
  virtual void onSegmentsFinalized(const std::vector<Segment> &segments) {}
  virtual void onSegmentsExpired(const std::vector<SegmentId> &ids) {}
  // Already finalized segments whose next link moved to a merge keeper.
  virtual void onSegmentsRelinked(const std::vector<Segment> &segments) {}
};
