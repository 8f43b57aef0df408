#pragma once

#include "core/TimelineManager.hpp" // TimelineManager
#include "core/TimelineStore.hpp"   // TimelineStore
#include "httplib.h"
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
// Every engine call happens under `engine_mutex_`.
class HttpHandler {
public:
  HttpHandler(TimelineManager &timeline, std::mutex &engine_mutex,
              TimelineStore *store = nullptr)
      : timeline_(timeline), engine_mutex_(engine_mutex), store_(store) {}

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

private:
  TimelineManager &timeline_;
  std::mutex &engine_mutex_;
  TimelineStore *store_; // optional archive

  // Individual request handlers
  void handleSample(const httplib::Request &req, httplib::Response &res);
  void handleSamples(const httplib::Request &req, httplib::Response &res);
  void handleRecording(bool start, httplib::Response &res);
  void handleTimeline(const httplib::Request &req, httplib::Response &res);
  void handleHistory(const httplib::Request &req, httplib::Response &res);
};
