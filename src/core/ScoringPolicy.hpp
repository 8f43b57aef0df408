#pragma once
#include "models/MergeModel.hpp"
#include "models/SegmentModel.hpp"

// Judges segments and candidate merges. The engine only consumes the ordinal
// results; the formulas live in the concrete policy.
class ScoringPolicy {
public:
  virtual ~ScoringPolicy() = default;

  virtual bool isWorthKeeping(const Segment &segment) const = 0;
  virtual int keepnessScore(const Segment &segment) const = 0;

  // Quality of absorbing `deadman` (and `betweener`, if any) into `keeper`.
  virtual MergeScore score(const Segment &keeper, const Segment &deadman,
                           const Segment *betweener) const = 0;

  // Clean up the boundary samples of `segment` against its active
  // neighbours. Either neighbour may be null. Called before any scoring that
  // involves `segment`.
  virtual void sanitizeEdges(Segment &segment, Segment *previous,
                             Segment *next) const {}
};
