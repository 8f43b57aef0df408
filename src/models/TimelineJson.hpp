#pragma once

#include "models/CoreTypes.hpp"
#include "models/SegmentModel.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

// Define to_json()/from_json() overloads so the model structs work with
// json::get() and json assignment.

// --- Coordinate ----
inline void to_json(Json &j, const Coordinate &c) {
  j = Json{{"lat", c.lat}, {"lon", c.lon}};
  if (c.accuracy_m > 0.0)
    j["accuracy"] = c.accuracy_m;
}

inline void from_json(const Json &j, Coordinate &c) {
  c.lat = j.at("lat").get<double>();
  c.lon = j.at("lon").get<double>();
  c.accuracy_m = j.value("accuracy", 0.0);
}

// --- LocomotionSample ----
// Wire form: {"timestamp": 1700000000.0, "moving_state": "moving",
//             "lat": 51.5, "lon": -0.12, "accuracy": 8.0}
inline void to_json(Json &j, const LocomotionSample &s) {
  j = Json{{"timestamp", s.timestamp},
           {"moving_state", MovingStateToString(s.moving_state)}};
  if (s.coord) {
    j["lat"] = s.coord->lat;
    j["lon"] = s.coord->lon;
    if (s.coord->accuracy_m > 0.0)
      j["accuracy"] = s.coord->accuracy_m;
  }
}

inline void from_json(const Json &j, LocomotionSample &s) {
  s.timestamp = j.at("timestamp").get<double>();
  const std::string state = j.value("moving_state", "uncertain");
  auto parsed = MovingStateFromString(state);
  if (!parsed)
    throw std::invalid_argument("unknown moving_state '" + state + "'");
  s.moving_state = *parsed;
  if (j.contains("lat") && j.contains("lon"))
    s.coord = j.get<Coordinate>();
  else
    s.coord.reset();
}

// --- Segment ----
inline void to_json(Json &j, const Segment &seg) {
  j = Json{{"id", seg.id},
           {"kind", SegmentKindToString(seg.kind)},
           {"start", seg.start},
           {"end", nullptr},
           {"previous", nullptr},
           {"next", nullptr},
           {"samples", seg.samples}};
  if (seg.end)
    j["end"] = *seg.end;
  if (seg.previous)
    j["previous"] = *seg.previous;
  if (seg.next)
    j["next"] = *seg.next;
}

inline void from_json(const Json &j, Segment &seg) {
  seg.id = j.at("id").get<SegmentId>();
  seg.kind = j.value("kind", "path") == "visit" ? SegmentKind::Visit
                                                : SegmentKind::Path;
  seg.start = j.at("start").get<double>();
  seg.end.reset();
  seg.previous.reset();
  seg.next.reset();
  if (j.contains("end") && !j.at("end").is_null())
    seg.end = j.at("end").get<double>();
  if (j.contains("previous") && !j.at("previous").is_null())
    seg.previous = j.at("previous").get<SegmentId>();
  if (j.contains("next") && !j.at("next").is_null())
    seg.next = j.at("next").get<SegmentId>();
  seg.samples = j.value("samples", std::vector<LocomotionSample>{});
}
