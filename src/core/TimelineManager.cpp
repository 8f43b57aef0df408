// TimelineManager orchestrates segment building, consolidation and retention.

#include "core/TimelineManager.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

// Marks a processing cycle so observer callbacks cannot re-enter submit().
struct CycleGuard {
  explicit CycleGuard(bool &flag) : flag_(flag) { flag_ = true; }
  ~CycleGuard() { flag_ = false; }
  bool &flag_;
};

} // namespace

TimelineManager::TimelineManager(const ScoringPolicy &policy, TimelineParams p,
                                 SegmentId first_id)
    : P(p), policy_(policy), chain_(first_id), builder_(chain_, P),
      consolidation_(chain_, policy_, P.verbose),
      retention_(chain_, policy_, P.verbose) {
  P.validate();
}

void TimelineManager::setParams(const TimelineParams &params) {
  params.validate();
  P = params;
  consolidation_.setVerbose(P.verbose);
  retention_.setVerbose(P.verbose);
}

void TimelineManager::setSamplesPerMinute(double samples_per_minute) {
  TimelineParams next = P;
  next.samples_per_minute = samples_per_minute;
  setParams(next);
}

void TimelineManager::setHistoryRetention(double retention_s) {
  TimelineParams next = P;
  next.history_retention_s = retention_s;
  setParams(next);
}

std::vector<Segment> TimelineManager::activeSegments() const {
  return chain_.activeSnapshot();
}

std::vector<Segment> TimelineManager::finalizedSegments() const {
  return chain_.finalizedSnapshot();
}

void TimelineManager::addObserver(TimelineObserver *observer) {
  if (!observer)
    throw std::invalid_argument("observer must not be null");
  if (std::find(observers_.begin(), observers_.end(), observer) ==
      observers_.end())
    observers_.push_back(observer);
}

void TimelineManager::removeObserver(TimelineObserver *observer) {
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                   observers_.end());
}

bool TimelineManager::submit(const LocomotionSample &sample) {
  if (!recording_)
    return false;
  if (processing_)
    throw std::logic_error(
        "TimelineManager::submit called from inside a processing cycle");

  CycleGuard guard(processing_);
  const auto observers = observers_;

  auto added = builder_.add(sample);
  if (added.outcome == SegmentBuilder::Outcome::RateLimited)
    return false;

  if (added.outcome == SegmentBuilder::Outcome::Created) {
    const Segment &created = chain_.at(added.segment);
    for (auto *o : observers)
      o->onSegmentCreated(created);
  }

  processTimeline(sample.timestamp);

  for (auto *o : observers)
    o->onProcessingCompleted();
  return true;
}

void TimelineManager::processTimeline(double now) {
  const auto observers = observers_;

  auto consolidated = consolidation_.consolidate();
  if (!consolidated.relinked.empty()) {
    std::vector<Segment> relinked;
    relinked.reserve(consolidated.relinked.size());
    for (SegmentId id : consolidated.relinked)
      relinked.push_back(chain_.at(id));
    for (auto *o : observers)
      o->onSegmentsRelinked(relinked);
  }

  // housekeeping
  auto promoted = retention_.promoteSettled();
  if (!promoted.empty()) {
    std::vector<Segment> finalized;
    finalized.reserve(promoted.size());
    for (SegmentId id : promoted)
      finalized.push_back(chain_.at(id));
    for (auto *o : observers)
      o->onSegmentsFinalized(finalized);
  }

  auto expired = retention_.expireOld(now, P.history_retention_s);
  if (!expired.empty()) {
    for (auto *o : observers)
      o->onSegmentsExpired(expired);
  }

  assert(chain_.verifyActive());
  assert(chain_.verifyFinalized());
}
