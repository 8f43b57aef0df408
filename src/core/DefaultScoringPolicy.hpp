#pragma once
#include "core/ScoringPolicy.hpp"
#include "models/params.hpp"

//------------------------------------------------------------------------------
// DefaultScoringPolicy: duration/distance/radius heuristics driven by
// ScoringParams (the "scoring" section of the settings file)
//------------------------------------------------------------------------------
class DefaultScoringPolicy final : public ScoringPolicy {
public:
  explicit DefaultScoringPolicy(ScoringParams p = ScoringParams{}) : P(p) {}

  bool isWorthKeeping(const Segment &segment) const override;
  int keepnessScore(const Segment &segment) const override;
  MergeScore score(const Segment &keeper, const Segment &deadman,
                   const Segment *betweener) const override;
  void sanitizeEdges(Segment &segment, Segment *previous,
                     Segment *next) const override;

  bool isValid(const Segment &segment) const;

  // Clamped footprint radius of a Visit; nullopt without located samples.
  std::optional<double> visitRadius(const Segment &visit) const;

  const ScoringParams &params() const noexcept { return P; }

private:
  ScoringParams P;

  MergeScore pairScore(const Segment &keeper, const Segment &deadman) const;
  bool visitContains(const Segment &visit, const Segment &other) const;
  bool visitsOverlap(const Segment &a, const Segment &b) const;
  // Move at most one boundary sample of `path` into the adjacent `visit`.
  // `path_first` is true when the path precedes the visit.
  bool stealEdge(Segment &path, Segment &visit, bool path_first) const;
};
