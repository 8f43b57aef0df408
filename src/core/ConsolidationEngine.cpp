// ConsolidationEngine keeps the active timeline compact: it merges noise
// segments into their stronger neighbours until no beneficial merge remains.

#include "core/ConsolidationEngine.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <stdexcept>

namespace {

MergeCandidate makeCandidate(SegmentId keeper, SegmentId deadman,
                             std::optional<SegmentId> betweener = {}) {
  MergeCandidate m;
  m.keeper = keeper;
  m.deadman = deadman;
  m.betweener = betweener;
  return m;
}

} // namespace

bool ConsolidationEngine::eligible() const {
  if (chain_.activeIds().empty())
    return false;
  // only process from a keeper current segment
  const Segment *current = chain_.current();
  return current && policy_.isWorthKeeping(*current);
}

std::vector<MergeCandidate> ConsolidationEngine::collectCandidates() {
  std::vector<MergeCandidate> merges;
  Segment *working = chain_.current();
  if (!working)
    return merges;

  const std::size_t limit = chain_.activeCount();
  std::size_t steps = 0;

  while (true) {
    // clean up edges before calculating any merge scores
    policy_.sanitizeEdges(*working, chain_.findActive(working->previous),
                          chain_.findActive(working->next));

    // finalized segments are never revisited
    Segment *previous = chain_.findActive(working->previous);
    if (!previous)
      break;

    merges.push_back(makeCandidate(working->id, previous->id));
    merges.push_back(makeCandidate(previous->id, working->id));

    // a weak segment between two stronger ones can bridge them
    const int working_keepness = policy_.keepnessScore(*working);
    const int previous_keepness = policy_.keepnessScore(*previous);
    if (previous_keepness < working_keepness) {
      Segment *prev_prev = chain_.findActive(previous->previous);
      if (prev_prev && policy_.keepnessScore(*prev_prev) > previous_keepness) {
        merges.push_back(
            makeCandidate(working->id, prev_prev->id, previous->id));
        merges.push_back(
            makeCandidate(prev_prev->id, working->id, previous->id));
      }
    }

    working = previous;
    if (++steps > limit)
      throw std::logic_error("cycle in active chain at segment " +
                             std::to_string(working->id));
  }

  // score once every edge has been sanitized
  for (auto &m : merges) {
    const Segment *betweener = m.betweener ? &chain_.at(*m.betweener) : nullptr;
    m.score = policy_.score(chain_.at(m.keeper), chain_.at(m.deadman),
                            betweener);
  }
  return merges;
}

std::vector<SegmentId> ConsolidationEngine::apply(const MergeCandidate &merge) {
  if (merge.score == MergeScore::Impossible)
    throw std::logic_error("refusing impossible merge: " + merge.describe());

  Segment &keeper = chain_.at(merge.keeper);
  std::vector<Segment *> group{&keeper, &chain_.at(merge.deadman)};
  if (merge.betweener)
    group.push_back(&chain_.at(*merge.betweener));

  for (const Segment *seg : group) {
    if (!chain_.isActive(seg->id))
      throw std::logic_error("merge touches inactive segment " +
                             std::to_string(seg->id));
  }

  std::sort(group.begin(), group.end(),
            [](const Segment *a, const Segment *b) { return a->start < b->start; });
  for (std::size_t i = 0; i + 1 < group.size(); ++i) {
    if (group[i]->next != group[i + 1]->id)
      throw std::logic_error("merge group is not contiguous: " +
                             merge.describe());
  }

  const Segment *first = group.front();
  const Segment *last = group.back();
  const std::optional<SegmentId> before = first->previous;
  const std::optional<SegmentId> after = last->next;
  const double start = first->start;
  const std::optional<double> end = last->end;

  std::vector<LocomotionSample> merged;
  std::vector<SegmentId> died;
  for (const Segment *seg : group) {
    merged.insert(merged.end(), seg->samples.begin(), seg->samples.end());
    if (seg != &keeper)
      died.push_back(seg->id);
  }
  std::stable_sort(merged.begin(), merged.end(),
                   [](const LocomotionSample &a, const LocomotionSample &b) {
                     return a.timestamp < b.timestamp;
                   });

  // keeper takes over the whole group's extent and its outer links
  keeper.samples = std::move(merged);
  keeper.start = start;
  keeper.end = end;
  keeper.previous = before;
  keeper.next = after;
  if (before) {
    if (Segment *p = chain_.find(*before))
      p->next = keeper.id;
  }
  if (after) {
    if (Segment *n = chain_.find(*after))
      n->previous = keeper.id;
  }

  for (SegmentId id : died) {
    Segment &dead = chain_.at(id);
    dead.previous.reset();
    dead.next.reset();
    dead.samples.clear();
  }
  return died;
}

ConsolidationEngine::Result ConsolidationEngine::consolidate() {
  Result result;
  const std::size_t bound = chain_.activeCount();

  while (eligible()) {
    auto merges = collectCandidates();
    if (merges.empty())
      break;

    // highest score first; ties keep generation order (newest pair first)
    std::stable_sort(merges.begin(), merges.end(),
                     [](const MergeCandidate &a, const MergeCandidate &b) {
                       return a.score > b.score;
                     });

    if (verbose_) {
      std::cout << "[consolidate] " << merges.size() << " candidate(s)\n";
      for (const auto &m : merges)
        std::cout << "[consolidate]   " << m.describe() << "\n";
    }

    // do the highest scoring valid merge
    const MergeCandidate &winner = merges.front();
    if (winner.score == MergeScore::Impossible)
      break;

    if (verbose_)
      std::cout << "[consolidate] DOING: " << winner.describe() << "\n";

    const std::size_t before = chain_.activeCount();
    auto died = apply(winner);
    // sweep up the dead bodies
    chain_.removeActive(died);
    if (chain_.activeCount() >= before)
      throw std::logic_error("merge did not shrink the active set: " +
                             winner.describe());
    assert(chain_.verifyActive());

    ++result.merges;
    result.died.insert(result.died.end(), died.begin(), died.end());
    const Segment &keeper = chain_.at(winner.keeper);
    if (keeper.previous && chain_.isFinalized(*keeper.previous) &&
        std::find(result.relinked.begin(), result.relinked.end(),
                  *keeper.previous) == result.relinked.end())
      result.relinked.push_back(*keeper.previous);
  }

  assert(result.merges <= bound);
  (void)bound;
  return result;
}
