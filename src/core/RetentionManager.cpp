#include "core/RetentionManager.hpp"
#include <cassert>
#include <iostream>

std::vector<SegmentId> RetentionManager::promoteSettled() {
  const auto &active = chain_.activeIds();

  // find the second keeper counting back from the newest
  int keeper_count = 0;
  std::size_t boundary = 0;
  bool found = false;
  for (std::size_t i = active.size(); i-- > 0;) {
    if (policy_.isWorthKeeping(chain_.at(active[i])))
      ++keeper_count;
    if (keeper_count == 2) {
      boundary = i;
      found = true;
      break;
    }
  }
  if (!found || boundary == 0)
    return {};

  // move the newly finalized segments to their new home
  auto moved = chain_.promoteOldest(boundary);
  if (verbose_)
    std::cout << "[retention] Finalized " << moved.size()
              << " timeline segment(s).\n";
  return moved;
}

std::vector<SegmentId> RetentionManager::expireOld(double now,
                                                   double retention_s) {
  auto released = chain_.discardFinalized([&](const Segment &seg) {
    if (!seg.end) {
      std::cerr << "[retention] open segment " << seg.id
                << " found in finalized store\n";
      assert(false && "open segment in finalized store");
      return false;
    }
    return now - *seg.end > retention_s;
  });
  if (verbose_ && !released.empty())
    std::cout << "[retention] Released " << released.size()
              << " historical timeline segment(s).\n";
  return released;
}
