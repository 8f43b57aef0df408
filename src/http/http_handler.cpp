#include "http_handler.hpp"
#include "debug/json_debug.hpp"
#include "http/query_params.hpp"
#include "models/TimelineJson.hpp"
#include "nlohmann/json.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace {

void reply_error(httplib::Response &res, int status, const std::string &what) {
  res.status = status;
  res.set_content(json{{"ok", false}, {"error", what}}.dump(),
                  "application/json");
}

// Parses the body, answering 400 itself when it is not valid JSON.
bool parse_body(const httplib::Request &req, httplib::Response &res,
                json &out) {
  try {
    out = json::parse(req.body);
    return true;
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(parse_error_json(req.body, e).dump(), "application/json");
    return false;
  }
}

double param_or(const httplib::Request &req, const char *key, double dflt) {
  if (!req.has_param(key))
    return dflt;
  return parse_number_param(key, req.get_param_value(key));
}

} // namespace

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  try {
    if (action == "sample") {
      handleSample(req, res);
    } else if (action == "samples") {
      handleSamples(req, res);
    } else if (action == "recording/start") {
      handleRecording(true, res);
    } else if (action == "recording/stop") {
      handleRecording(false, res);
    } else {
      res.status = 404;
      res.set_content("Unknown action: " + action, "text/plain");
    }
  } catch (const json::exception &e) {
    reply_error(res, 400, e.what());
  } catch (const std::invalid_argument &e) {
    reply_error(res, 400, e.what());
  } catch (const std::exception &e) {
    std::cerr << "[http] POST " << action << " failed: " << e.what() << "\n";
    reply_error(res, 500, e.what());
  }
}

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  try {
    if (action == "timeline") {
      handleTimeline(req, res);
    } else if (action == "history") {
      handleHistory(req, res);
    }
    // default
    else {
      res.status = 404;
      res.set_content("Unknown action: " + action, "text/plain");
    }
  } catch (const std::invalid_argument &e) {
    reply_error(res, 400, e.what());
  } catch (const std::exception &e) {
    std::cerr << "[http] GET " << action << " failed: " << e.what() << "\n";
    reply_error(res, 500, e.what());
  }
}

// ===== samples =====

void HttpHandler::handleSample(const httplib::Request &req,
                               httplib::Response &res) {
  json body;
  if (!parse_body(req, res, body))
    return;
  const auto sample = body.get<LocomotionSample>();

  bool accepted = false;
  {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    accepted = timeline_.submit(sample);
  }
  res.set_content(json{{"ok", true}, {"accepted", accepted}}.dump(),
                  "application/json");
}

void HttpHandler::handleSamples(const httplib::Request &req,
                                httplib::Response &res) {
  json body;
  if (!parse_body(req, res, body))
    return;
  if (!body.is_array()) {
    reply_error(res, 400, "expected an array of samples");
    return;
  }
  // validate the whole batch before touching the engine
  const auto samples = body.get<std::vector<LocomotionSample>>();

  int accepted = 0;
  {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    for (const auto &s : samples)
      accepted += timeline_.submit(s) ? 1 : 0;
  }
  res.set_content(json{{"ok", true},
                       {"received", samples.size()},
                       {"accepted", accepted}}
                      .dump(),
                  "application/json");
}

void HttpHandler::handleRecording(bool start, httplib::Response &res) {
  std::lock_guard<std::mutex> lock(engine_mutex_);
  if (start)
    timeline_.startRecording();
  else
    timeline_.stopRecording();
  res.set_content(
      json{{"ok", true}, {"recording", timeline_.isRecording()}}.dump(),
      "application/json");
}

// ===== views =====

void HttpHandler::handleTimeline(const httplib::Request &req,
                                 httplib::Response &res) {
  const bool with_samples =
      !req.has_param("samples") || req.get_param_value("samples") != "false";

  json out;
  {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    const Segment *current = timeline_.currentSegment();
    out["recording"] = timeline_.isRecording();
    out["current"] = current ? json(current->id) : json(nullptr);
    out["active"] = timeline_.activeSegments();
    out["finalized"] = timeline_.finalizedSegments();
  }
  if (!with_samples) {
    for (auto &seg : out["active"])
      seg.erase("samples");
    for (auto &seg : out["finalized"])
      seg.erase("samples");
  }
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_content(out.dump(), "application/json");
}

void HttpHandler::handleHistory(const httplib::Request &req,
                                httplib::Response &res) {
  if (!store_) {
    reply_error(res, 404, "no timeline archive configured");
    return;
  }
  const double from = param_or(req, "from", 0.0);
  const double to =
      param_or(req, "to", std::numeric_limits<double>::max());
  if (from > to) {
    reply_error(res, 400, "from must not be after to");
    return;
  }

  std::vector<Segment> segments;
  {
    // the archive connection is shared with the engine's archiver
    std::lock_guard<std::mutex> lock(engine_mutex_);
    segments = store_->query_segments_between(from, to);
  }
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_content(json{{"ok", true}, {"segments", segments}}.dump(),
                  "application/json");
}
