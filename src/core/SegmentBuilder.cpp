#include "core/SegmentBuilder.hpp"

bool SegmentBuilder::tooSoon(const LocomotionSample &sample) const {
  if (!last_accepted_)
    return false;
  return sample.timestamp - *last_accepted_ < params_.minSampleSpacing();
}

SegmentBuilder::Result SegmentBuilder::add(const LocomotionSample &sample) {
  Result r;
  // don't record too soon
  if (tooSoon(sample))
    return r;
  last_accepted_ = sample.timestamp;

  // can continue the current segment?
  Segment *current = chain_.current();
  if (current && ContinuesOn(current->kind, sample.moving_state)) {
    current->samples.push_back(sample);
    r.outcome = Outcome::Appended;
    r.segment = current->id;
    return r;
  }

  // switched between path and visit: close the current one first
  if (current)
    current->end = current->samples.back().timestamp;

  Segment &created =
      chain_.openSegment(SegmentKindForState(sample.moving_state), sample);
  r.outcome = Outcome::Created;
  r.segment = created.id;
  return r;
}
