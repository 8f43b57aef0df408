#pragma once

#include "models/SegmentModel.hpp"
#include <cstdint>
#include <optional>
#include <string>

// Ordinal merge quality. Impossible is the distinguished worst value and is
// never applied.
enum class MergeScore : uint8_t {
  Impossible = 0,
  VeryLow,
  Low,
  Medium,
  High,
  Perfect
};

inline const char *MergeScoreToString(MergeScore score) {
  switch (score) {
  case MergeScore::VeryLow:
    return "veryLow";
  case MergeScore::Low:
    return "low";
  case MergeScore::Medium:
    return "medium";
  case MergeScore::High:
    return "high";
  case MergeScore::Perfect:
    return "perfect";
  default:
    return "impossible";
  }
}

//------------------------------------------------------------------------------
// MergeCandidate: keeper survives, deadman (and betweener) are absorbed
//------------------------------------------------------------------------------
struct MergeCandidate {
  SegmentId keeper = 0;
  SegmentId deadman = 0;
  std::optional<SegmentId> betweener;
  MergeScore score = MergeScore::Impossible;

  std::string describe() const {
    std::string s = "keeper=" + std::to_string(keeper);
    if (betweener)
      s += " betweener=" + std::to_string(*betweener);
    s += " deadman=" + std::to_string(deadman);
    s += " score=";
    s += MergeScoreToString(score);
    return s;
  }
};
