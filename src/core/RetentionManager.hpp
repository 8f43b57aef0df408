#pragma once
#include "core/ScoringPolicy.hpp"
#include "core/TimelineChain.hpp"
#include <vector>

// Housekeeping of the two tiers: settled active segments move to the
// finalized store, old finalized segments are released.
class RetentionManager {
public:
  RetentionManager(TimelineChain &chain, const ScoringPolicy &policy,
                   bool verbose = false)
      : chain_(chain), policy_(policy), verbose_(verbose) {}

  // Finalize everything older than the second-newest worth keeping active
  // segment. Returns the promoted ids, oldest first.
  std::vector<SegmentId> promoteSettled();

  // Release finalized segments whose end is more than `retention_s` before
  // `now`. Returns the released ids.
  std::vector<SegmentId> expireOld(double now, double retention_s);

  void setVerbose(bool verbose) noexcept { verbose_ = verbose; }

private:
  TimelineChain &chain_;
  const ScoringPolicy &policy_;
  bool verbose_;
};
