#pragma once
#include "core/ConsolidationEngine.hpp"
#include "core/RetentionManager.hpp"
#include "core/ScoringPolicy.hpp"
#include "core/SegmentBuilder.hpp"
#include "core/TimelineChain.hpp"
#include "core/TimelineObserver.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <vector>

// Main object of the timeline engine
//
// Turns classified samples into a linked history of Paths and Visits:
// builder -> consolidation -> retention -> notification, once per accepted
// sample. Not thread safe; hosts serialize calls.
//------------------------------------------------------------------------------
class TimelineManager {
public:
  // `first_id` is the id of the first segment created; hosts with an archive
  // pass one past the archive's highest id.
  explicit TimelineManager(const ScoringPolicy &policy,
                           TimelineParams p = TimelineParams{},
                           SegmentId first_id = 1);
  ~TimelineManager() = default;

  TimelineManager(const TimelineManager &) = delete;
  TimelineManager &operator=(const TimelineManager &) = delete;

  void setParams(const TimelineParams &params);
  const TimelineParams &params() const noexcept { return P; }
  void setSamplesPerMinute(double samples_per_minute);
  void setHistoryRetention(double retention_s);

  void startRecording() noexcept { recording_ = true; }
  void stopRecording() noexcept { recording_ = false; }
  bool isRecording() const noexcept { return recording_; }

  // Runs one full cycle for the sample. Returns false when the sample was
  // ignored (not recording, or arrived too soon).
  bool submit(const LocomotionSample &sample);

  const Segment *currentSegment() const { return chain_.current(); }
  std::vector<Segment> activeSegments() const;
  std::vector<Segment> finalizedSegments() const;
  const TimelineChain &chain() const noexcept { return chain_; }

  // Observers are not owned and must outlive their registration.
  void addObserver(TimelineObserver *observer);
  void removeObserver(TimelineObserver *observer);

private:
  TimelineParams P;
  const ScoringPolicy &policy_;
  TimelineChain chain_;
  SegmentBuilder builder_;
  ConsolidationEngine consolidation_;
  RetentionManager retention_;
  std::vector<TimelineObserver *> observers_;
  bool recording_ = false;
  bool processing_ = false;

  void processTimeline(double now);
};
