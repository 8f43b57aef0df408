// TimelineChain keeps the arena of segments and the active/finalized id lists
// consistent with the previous/next links.

#include "core/TimelineChain.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

TimelineChain::TimelineChain(SegmentId first_id) : next_id_(first_id) {
  if (first_id == 0)
    throw std::invalid_argument("segment ids start at 1");
}

Segment &TimelineChain::openSegment(SegmentKind kind,
                                    const LocomotionSample &first) {
  Segment seg;
  seg.id = next_id_++;
  seg.kind = kind;
  seg.start = first.timestamp;
  seg.samples.push_back(first);

  // keep the list linked
  if (!active_.empty()) {
    Segment &last = at(active_.back());
    last.next = seg.id;
    seg.previous = last.id;
  }

  const SegmentId id = seg.id;
  arena_.emplace(id, std::move(seg));
  active_.push_back(id);
  return arena_.at(id);
}

Segment *TimelineChain::find(SegmentId id) {
  auto it = arena_.find(id);
  return it == arena_.end() ? nullptr : &it->second;
}

const Segment *TimelineChain::find(SegmentId id) const {
  auto it = arena_.find(id);
  return it == arena_.end() ? nullptr : &it->second;
}

Segment &TimelineChain::at(SegmentId id) {
  auto it = arena_.find(id);
  if (it == arena_.end())
    throw std::out_of_range("unknown segment id " + std::to_string(id));
  return it->second;
}

const Segment &TimelineChain::at(SegmentId id) const {
  auto it = arena_.find(id);
  if (it == arena_.end())
    throw std::out_of_range("unknown segment id " + std::to_string(id));
  return it->second;
}

Segment *TimelineChain::findActive(std::optional<SegmentId> id) {
  if (!id || !isActive(*id))
    return nullptr;
  return find(*id);
}

bool TimelineChain::isActive(SegmentId id) const {
  return std::find(active_.begin(), active_.end(), id) != active_.end();
}

bool TimelineChain::isFinalized(SegmentId id) const {
  return std::find(finalized_.begin(), finalized_.end(), id) !=
         finalized_.end();
}

Segment *TimelineChain::current() {
  if (active_.empty())
    return nullptr;
  Segment &last = at(active_.back());
  return last.isOpen() ? &last : nullptr;
}

const Segment *TimelineChain::current() const {
  if (active_.empty())
    return nullptr;
  const Segment &last = at(active_.back());
  return last.isOpen() ? &last : nullptr;
}

void TimelineChain::removeActive(const std::vector<SegmentId> &ids) {
  for (SegmentId id : ids) {
    auto it = std::find(active_.begin(), active_.end(), id);
    if (it == active_.end())
      continue;
    active_.erase(it);
    arena_.erase(id);
  }
}

std::vector<SegmentId> TimelineChain::promoteOldest(std::size_t count) {
  count = std::min(count, active_.size());
  std::vector<SegmentId> moved(active_.begin(), active_.begin() + count);
  finalized_.insert(finalized_.end(), moved.begin(), moved.end());
  active_.erase(active_.begin(), active_.begin() + count);
  return moved;
}

std::vector<SegmentId> TimelineChain::discardFinalized(
    const std::function<bool(const Segment &)> &expired) {
  std::vector<SegmentId> gone;
  for (SegmentId id : finalized_) {
    if (expired(at(id)))
      gone.push_back(id);
  }
  if (gone.empty())
    return gone;

  for (SegmentId id : gone) {
    const Segment &seg = at(id);
    // neighbours keep no link to a segment that no longer exists
    if (seg.previous) {
      if (Segment *p = find(*seg.previous); p && p->next == id)
        p->next.reset();
    }
    if (seg.next) {
      if (Segment *n = find(*seg.next); n && n->previous == id)
        n->previous.reset();
    }
    arena_.erase(id);
  }
  finalized_.erase(std::remove_if(finalized_.begin(), finalized_.end(),
                                  [this](SegmentId id) {
                                    return arena_.count(id) == 0;
                                  }),
                   finalized_.end());
  return gone;
}

std::vector<Segment>
TimelineChain::snapshot(const std::vector<SegmentId> &ids) const {
  std::vector<Segment> out;
  out.reserve(ids.size());
  for (SegmentId id : ids)
    out.push_back(at(id));
  return out;
}

std::vector<Segment> TimelineChain::activeSnapshot() const {
  return snapshot(active_);
}

std::vector<Segment> TimelineChain::finalizedSnapshot() const {
  return snapshot(finalized_);
}

bool TimelineChain::verifyActive(std::string *why) const {
  auto fail = [why](const std::string &msg) {
    if (why)
      *why = msg;
    return false;
  };

  std::unordered_set<SegmentId> seen;
  for (size_t i = 0; i < active_.size(); ++i) {
    const SegmentId id = active_[i];
    const Segment *seg = find(id);
    if (!seg)
      return fail("active id " + std::to_string(id) + " missing from arena");
    if (!seen.insert(id).second)
      return fail("active id " + std::to_string(id) + " listed twice");
    if (isFinalized(id))
      return fail("segment " + std::to_string(id) + " is active and finalized");
    if (seg->isOpen() && i + 1 != active_.size())
      return fail("open segment " + std::to_string(id) + " is not last");

    if (i + 1 < active_.size()) {
      const Segment *nxt = find(active_[i + 1]);
      if (!nxt)
        return fail("active id " + std::to_string(active_[i + 1]) +
                    " missing from arena");
      if (nxt->start < seg->start)
        return fail("active set out of order at " + std::to_string(id));
      if (seg->next != nxt->id || nxt->previous != seg->id)
        return fail("broken link between " + std::to_string(id) + " and " +
                    std::to_string(nxt->id));
    } else if (seg->next) {
      return fail("last active segment " + std::to_string(id) +
                  " links forward");
    }
  }
  return true;
}

bool TimelineChain::verifyFinalized(std::string *why) const {
  auto fail = [why](const std::string &msg) {
    if (why)
      *why = msg;
    return false;
  };

  for (size_t i = 0; i < finalized_.size(); ++i) {
    const Segment *seg = find(finalized_[i]);
    if (!seg)
      return fail("finalized id " + std::to_string(finalized_[i]) +
                  " missing from arena");
    if (seg->isOpen())
      return fail("open segment " + std::to_string(seg->id) +
                  " in finalized store");
    if (isActive(seg->id))
      return fail("segment " + std::to_string(seg->id) +
                  " is active and finalized");
    if (i > 0 && seg->start < at(finalized_[i - 1]).start)
      return fail("finalized store out of order at " +
                  std::to_string(seg->id));
  }
  return true;
}
