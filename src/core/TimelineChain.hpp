#pragma once
#include "models/SegmentModel.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

//------------------------------------------------------------------------------
// TimelineChain: owns every live segment (arena keyed by id) and the two
// ordered id lists. previous/next are weak lookups into the arena.
//------------------------------------------------------------------------------
class TimelineChain {
public:
  // Ids are handed out from `first_id` upwards; a restarted engine seeds it
  // past the highest id already archived.
  explicit TimelineChain(SegmentId first_id = 1);

  // Create a segment from its first sample and append it to the active set,
  // linked after the current last active segment (if any).
  Segment &openSegment(SegmentKind kind, const LocomotionSample &first);

  Segment *find(SegmentId id);
  const Segment *find(SegmentId id) const;
  // Throws std::out_of_range for unknown ids.
  Segment &at(SegmentId id);
  const Segment &at(SegmentId id) const;

  // Resolve only when the id is in the active set.
  Segment *findActive(std::optional<SegmentId> id);

  bool isActive(SegmentId id) const;
  bool isFinalized(SegmentId id) const;

  // Last active segment when it is still open.
  Segment *current();
  const Segment *current() const;

  // Drop merged-away segments. Links must already bypass them.
  void removeActive(const std::vector<SegmentId> &ids);

  // Move the first `count` active segments to the finalized store.
  std::vector<SegmentId> promoteOldest(std::size_t count);

  // Discard finalized segments matching `expired`, repairing the links of
  // their surviving neighbours.
  std::vector<SegmentId>
  discardFinalized(const std::function<bool(const Segment &)> &expired);

  const std::vector<SegmentId> &activeIds() const noexcept { return active_; }
  const std::vector<SegmentId> &finalizedIds() const noexcept {
    return finalized_;
  }
  std::size_t activeCount() const noexcept { return active_.size(); }

  std::vector<Segment> activeSnapshot() const;
  std::vector<Segment> finalizedSnapshot() const;

  // Links, ordering and the single open segment of the active set. Fills
  // `why` on failure.
  bool verifyActive(std::string *why = nullptr) const;
  // Ordering of the finalized store; none of its segments may be open.
  bool verifyFinalized(std::string *why = nullptr) const;

private:
  std::unordered_map<SegmentId, Segment> arena_;
  std::vector<SegmentId> active_;
  std::vector<SegmentId> finalized_;
  SegmentId next_id_ = 1;

  std::vector<Segment> snapshot(const std::vector<SegmentId> &ids) const;
};
