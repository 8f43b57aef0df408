#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

// Settings of the timeline engine itself.
struct TimelineParams {
  double samples_per_minute = 10.0;
  double history_retention_s = 60.0 * 60.0 * 6.0;
  bool verbose = false;

  // Minimum spacing between accepted samples, in seconds.
  double minSampleSpacing() const { return 60.0 / samples_per_minute; }

  void validate() const {
    if (!(samples_per_minute > 0.0))
      throw std::invalid_argument("samples_per_minute must be positive");
    if (!(history_retention_s >= 0.0))
      throw std::invalid_argument("history_retention_s must not be negative");
  }

  static TimelineParams from_json(const nlohmann::json &j) {
    TimelineParams p;
    if (j.contains("samples_per_minute"))
      p.samples_per_minute = j.at("samples_per_minute").get<double>();
    if (j.contains("history_retention_s"))
      p.history_retention_s = j.at("history_retention_s").get<double>();
    if (j.contains("verbose"))
      p.verbose = j.at("verbose").get<bool>();
    p.validate();
    return p;
  }
};

// Thresholds used by DefaultScoringPolicy.
struct ScoringParams {
  double visit_min_valid_duration_s = 10.0;
  double visit_min_keeper_duration_s = 120.0;
  int path_min_valid_samples = 2;
  double path_min_keeper_duration_s = 60.0;
  double path_min_keeper_distance_m = 20.0;
  double visit_min_radius_m = 10.0;
  double visit_max_radius_m = 150.0;
  double max_merge_gap_s = 60.0 * 60.0;

  static ScoringParams from_json(const nlohmann::json &j) {
    ScoringParams p;
    if (j.contains("visit_min_valid_duration_s"))
      p.visit_min_valid_duration_s =
          j.at("visit_min_valid_duration_s").get<double>();
    if (j.contains("visit_min_keeper_duration_s"))
      p.visit_min_keeper_duration_s =
          j.at("visit_min_keeper_duration_s").get<double>();
    if (j.contains("path_min_valid_samples"))
      p.path_min_valid_samples = j.at("path_min_valid_samples").get<int>();
    if (j.contains("path_min_keeper_duration_s"))
      p.path_min_keeper_duration_s =
          j.at("path_min_keeper_duration_s").get<double>();
    if (j.contains("path_min_keeper_distance_m"))
      p.path_min_keeper_distance_m =
          j.at("path_min_keeper_distance_m").get<double>();
    if (j.contains("visit_min_radius_m"))
      p.visit_min_radius_m = j.at("visit_min_radius_m").get<double>();
    if (j.contains("visit_max_radius_m"))
      p.visit_max_radius_m = j.at("visit_max_radius_m").get<double>();
    if (j.contains("max_merge_gap_s"))
      p.max_merge_gap_s = j.at("max_merge_gap_s").get<double>();

    if (p.visit_min_radius_m > p.visit_max_radius_m)
      throw std::invalid_argument(
          "visit_min_radius_m must not exceed visit_max_radius_m");
    if (p.path_min_valid_samples < 1)
      throw std::invalid_argument("path_min_valid_samples must be at least 1");
    return p;
  }
};

// Connection settings for the MySQL timeline archive.
struct StoreParams {
  bool enabled = false;
  std::string uri = "tcp://127.0.0.1:3306";
  std::string user = "timeline_user";
  std::string password;
  std::string schema = "timeline";

  static StoreParams from_json(const nlohmann::json &j) {
    StoreParams p;
    if (j.contains("enabled"))
      p.enabled = j.at("enabled").get<bool>();
    if (j.contains("uri"))
      p.uri = j.at("uri").get<std::string>();
    if (j.contains("user"))
      p.user = j.at("user").get<std::string>();
    if (j.contains("password"))
      p.password = j.at("password").get<std::string>();
    if (j.contains("schema"))
      p.schema = j.at("schema").get<std::string>();
    return p;
  }
};
