#include "core/TimelineArchiver.hpp"
#include <exception>
#include <iostream>

void TimelineArchiver::onSegmentsFinalized(
    const std::vector<Segment> &segments) {
  if (persist(segments))
    archived_ += segments.size();
}

void TimelineArchiver::onSegmentsRelinked(
    const std::vector<Segment> &segments) {
  if (persist(segments))
    rewritten_ += segments.size();
}

bool TimelineArchiver::persist(const std::vector<Segment> &segments) {
  if (segments.empty())
    return false;
  try {
    store_.begin();
    for (const auto &seg : segments)
      store_.upsert_segment(seg);
    store_.commit();
    return true;
  } catch (const std::exception &e) {
    ++failed_;
    std::cerr << "[archive] failed to persist " << segments.size()
              << " segment(s): " << e.what() << "\n";
    try {
      store_.rollback();
    } catch (const std::exception &rb) {
      std::cerr << "[archive] rollback failed: " << rb.what() << "\n";
    }
    return false;
  }
}
