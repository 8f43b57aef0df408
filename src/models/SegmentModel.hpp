#pragma once

#include "models/CoreTypes.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

using SegmentId = uint64_t;

// High level classification for a timeline segment.
enum class SegmentKind : uint8_t {
  Path = 0, // in transit
  Visit     // stationary
};

inline const char *SegmentKindToString(SegmentKind kind) {
  switch (kind) {
  case SegmentKind::Visit:
    return "visit";
  default:
    return "path";
  }
}

inline SegmentKind SegmentKindForState(MovingState state) {
  return state == MovingState::Stationary ? SegmentKind::Visit
                                          : SegmentKind::Path;
}

// Rows: SegmentKind. Columns: MovingState (moving, uncertain, stationary).
inline constexpr std::array<std::array<bool, 3>, 2> kContinuationTable = {{
    {true, true, false}, // Path
    {false, false, true} // Visit
}};

inline bool ContinuesOn(SegmentKind kind, MovingState state) {
  return kContinuationTable[static_cast<size_t>(kind)]
                           [static_cast<size_t>(state)];
}

// A Path or Visit in the timeline chain. Neighbours are referenced by id and
// resolved through the owning TimelineChain.
struct Segment {
  SegmentId id = 0;
  SegmentKind kind = SegmentKind::Path;
  double start = 0.0;
  std::optional<double> end; // absent while this is the current segment
  std::vector<LocomotionSample> samples;
  std::optional<SegmentId> previous;
  std::optional<SegmentId> next;

  bool isOpen() const noexcept { return !end.has_value(); }

  // Time covered by the samples, in seconds.
  double duration() const noexcept {
    if (samples.empty())
      return 0.0;
    return samples.back().timestamp - samples.front().timestamp;
  }

  // Re-derive start/end after samples moved across a boundary.
  void refreshExtent() {
    if (samples.empty())
      return;
    start = samples.front().timestamp;
    if (end)
      end = samples.back().timestamp;
  }
};
