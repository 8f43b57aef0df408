// DefaultScoringPolicy scores segments from their duration, travelled
// distance and visit footprint.

#include "core/DefaultScoringPolicy.hpp"
#include "core/SegmentUtils.hpp"
#include <algorithm>

namespace {

MergeScore stepDown(MergeScore s) {
  if (s <= MergeScore::VeryLow)
    return s;
  return static_cast<MergeScore>(static_cast<int>(s) - 1);
}

} // namespace

bool DefaultScoringPolicy::isValid(const Segment &segment) const {
  if (segment.samples.empty())
    return false;
  if (segment.kind == SegmentKind::Visit)
    return segment.duration() >= P.visit_min_valid_duration_s;
  return static_cast<int>(segment.samples.size()) >= P.path_min_valid_samples;
}

bool DefaultScoringPolicy::isWorthKeeping(const Segment &segment) const {
  if (!isValid(segment))
    return false;
  if (segment.kind == SegmentKind::Visit)
    return segment.duration() >= P.visit_min_keeper_duration_s;

  if (segment.duration() < P.path_min_keeper_duration_s)
    return false;
  // distance can only be judged with at least two fixes
  int located = 0;
  for (const auto &s : segment.samples)
    located += s.coord ? 1 : 0;
  if (located < 2)
    return true;
  return SegmentUtils::pathDistance(segment.samples) >=
         P.path_min_keeper_distance_m;
}

int DefaultScoringPolicy::keepnessScore(const Segment &segment) const {
  if (isWorthKeeping(segment))
    return 2;
  if (isValid(segment))
    return 1;
  return 0;
}

std::optional<double>
DefaultScoringPolicy::visitRadius(const Segment &visit) const {
  auto fp = SegmentUtils::footprint(visit.samples);
  if (!fp)
    return std::nullopt;
  return SegmentUtils::clamp(fp->radius_m, P.visit_min_radius_m,
                             P.visit_max_radius_m);
}

bool DefaultScoringPolicy::visitContains(const Segment &visit,
                                         const Segment &other) const {
  auto fp = SegmentUtils::footprint(visit.samples);
  auto radius = visitRadius(visit);
  if (!fp || !radius)
    return false;
  int located = 0;
  for (const auto &s : other.samples) {
    if (!s.coord)
      continue;
    ++located;
    if (SegmentUtils::haversine(fp->centre, *s.coord) > *radius)
      return false;
  }
  return located > 0;
}

bool DefaultScoringPolicy::visitsOverlap(const Segment &a,
                                         const Segment &b) const {
  auto fa = SegmentUtils::footprint(a.samples);
  auto fb = SegmentUtils::footprint(b.samples);
  if (!fa || !fb)
    return false;
  const double ra = *visitRadius(a);
  const double rb = *visitRadius(b);
  return SegmentUtils::haversine(fa->centre, fb->centre) <= ra + rb;
}

MergeScore DefaultScoringPolicy::pairScore(const Segment &keeper,
                                           const Segment &deadman) const {
  if (!isValid(keeper))
    return MergeScore::Impossible;

  const int kk = keepnessScore(keeper);
  const int dk = keepnessScore(deadman);
  if (kk < dk)
    return MergeScore::Impossible;

  const bool same_kind = keeper.kind == deadman.kind;

  // two keepers only combine when they describe the same thing
  if (kk == 2 && dk == 2) {
    if (!same_kind)
      return MergeScore::Impossible;
    if (keeper.kind == SegmentKind::Visit)
      return visitsOverlap(keeper, deadman) ? MergeScore::Perfect
                                            : MergeScore::Impossible;
    return MergeScore::Medium;
  }

  if (kk == dk)
    return same_kind ? MergeScore::VeryLow : MergeScore::Impossible;

  MergeScore s;
  if (kk == 2 && dk == 0)
    s = same_kind ? MergeScore::High : MergeScore::Medium;
  else if (kk == 2)
    s = same_kind ? MergeScore::Medium : MergeScore::Low;
  else
    s = same_kind ? MergeScore::Low : MergeScore::VeryLow;

  if (keeper.kind == SegmentKind::Visit &&
      deadman.kind == SegmentKind::Path && visitContains(keeper, deadman))
    s = std::max(s, MergeScore::High);
  return s;
}

MergeScore DefaultScoringPolicy::score(const Segment &keeper,
                                       const Segment &deadman,
                                       const Segment *betweener) const {
  // chronological order of the group for gap checks
  std::vector<const Segment *> group{&keeper, &deadman};
  if (betweener)
    group.push_back(betweener);
  std::sort(group.begin(), group.end(),
            [](const Segment *a, const Segment *b) { return a->start < b->start; });
  for (size_t i = 0; i + 1 < group.size(); ++i) {
    if (SegmentUtils::timeGap(*group[i], *group[i + 1]) > P.max_merge_gap_s)
      return MergeScore::Impossible;
  }

  MergeScore s = pairScore(keeper, deadman);
  if (!betweener || s == MergeScore::Impossible)
    return s;

  if (keepnessScore(*betweener) > keepnessScore(keeper))
    return MergeScore::Impossible;
  return stepDown(s);
}

bool DefaultScoringPolicy::stealEdge(Segment &path, Segment &visit,
                                     bool path_first) const {
  if (path.samples.size() < 2)
    return false;
  auto fp = SegmentUtils::footprint(visit.samples);
  auto radius = visitRadius(visit);
  if (!fp || !radius)
    return false;

  const LocomotionSample edge =
      path_first ? path.samples.back() : path.samples.front();
  if (!edge.coord)
    return false;
  if (SegmentUtils::haversine(fp->centre, *edge.coord) > *radius)
    return false;

  if (path_first) {
    visit.samples.insert(visit.samples.begin(), edge);
    path.samples.pop_back();
  } else {
    visit.samples.push_back(edge);
    path.samples.erase(path.samples.begin());
  }
  path.refreshExtent();
  visit.refreshExtent();
  return true;
}

void DefaultScoringPolicy::sanitizeEdges(Segment &segment, Segment *previous,
                                         Segment *next) const {
  if (segment.kind == SegmentKind::Path) {
    if (next && next->kind == SegmentKind::Visit)
      stealEdge(segment, *next, true);
    if (previous && previous->kind == SegmentKind::Visit)
      stealEdge(segment, *previous, false);
    return;
  }
  if (previous && previous->kind == SegmentKind::Path)
    stealEdge(*previous, segment, true);
  if (next && next->kind == SegmentKind::Path)
    stealEdge(*next, segment, false);
}
