#pragma once
#include "core/TimelineChain.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <optional>

// Decides whether a sample continues the current segment or opens a new one.
class SegmentBuilder {
public:
  enum class Outcome { RateLimited, Appended, Created };

  struct Result {
    Outcome outcome = Outcome::RateLimited;
    SegmentId segment = 0; // segment the sample landed in
  };

  SegmentBuilder(TimelineChain &chain, const TimelineParams &params)
      : chain_(chain), params_(params) {}

  Result add(const LocomotionSample &sample);

  std::optional<double> lastAccepted() const noexcept {
    return last_accepted_;
  }

private:
  TimelineChain &chain_;
  const TimelineParams &params_;
  std::optional<double> last_accepted_;

  bool tooSoon(const LocomotionSample &sample) const;
};
