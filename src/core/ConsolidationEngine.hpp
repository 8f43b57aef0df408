#pragma once
#include "core/ScoringPolicy.hpp"
#include "core/TimelineChain.hpp"
#include "models/MergeModel.hpp"
#include <cstddef>
#include <vector>

//------------------------------------------------------------------------------
// ConsolidationEngine: generates merge candidates walking back from the
// current segment, applies the best one and repeats until no merge qualifies.
//------------------------------------------------------------------------------
class ConsolidationEngine {
public:
  struct Result {
    std::size_t merges = 0;
    std::vector<SegmentId> died;
    // finalized segments whose forward link now points at a merge keeper
    std::vector<SegmentId> relinked;
  };

  ConsolidationEngine(TimelineChain &chain, const ScoringPolicy &policy,
                      bool verbose = false)
      : chain_(chain), policy_(policy), verbose_(verbose) {}

  // Runs merges to a fixpoint. Each applied merge strictly shrinks the
  // active set, so the loop runs at most activeCount() times.
  Result consolidate();

  // Sanitizes edges and returns every scored candidate, in generation order.
  std::vector<MergeCandidate> collectCandidates();

  // Absorbs deadman (and betweener) into keeper, repairs the chain links and
  // returns the ids that died. Does not touch the active id list.
  std::vector<SegmentId> apply(const MergeCandidate &merge);

  void setVerbose(bool verbose) noexcept { verbose_ = verbose; }

private:
  TimelineChain &chain_;
  const ScoringPolicy &policy_;
  bool verbose_;

  bool eligible() const;
};
