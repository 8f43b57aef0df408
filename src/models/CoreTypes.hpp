#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using Json = nlohmann::json;

// Basic spatial coordinate with the fix's horizontal accuracy.
struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;
  double accuracy_m = 0.0; // 0 when unknown
};

// Motion classification supplied by the sample source.
enum class MovingState : uint8_t { Moving = 0, Uncertain, Stationary };

inline const char *MovingStateToString(MovingState state) {
  switch (state) {
  case MovingState::Moving:
    return "moving";
  case MovingState::Stationary:
    return "stationary";
  default:
    return "uncertain";
  }
}

inline std::optional<MovingState> MovingStateFromString(const std::string &s) {
  if (s == "moving")
    return MovingState::Moving;
  if (s == "uncertain")
    return MovingState::Uncertain;
  if (s == "stationary")
    return MovingState::Stationary;
  return std::nullopt;
}

// A single classified location sample as delivered by the sample source.
struct LocomotionSample {
  double timestamp = 0.0; // seconds since epoch
  MovingState moving_state = MovingState::Uncertain;
  std::optional<Coordinate> coord; // absent when there was no usable fix
};
