// Entry point for the timeline HTTP server.  It loads configuration, builds one
// TimelineManager and exposes the REST endpoints handled by `HttpHandler`.

#include "core/DefaultScoringPolicy.hpp"
#include "core/TimelineArchiver.hpp"
#include "core/TimelineManager.hpp"
#include "http/http_handler.hpp"
#include "infra/MySQLTimelineStore.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <signal.h>
#include <unistd.h>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  std::ifstream cfg(cfg_path);
  if (!cfg) {
    std::cerr << "[ERROR] Cannot open " << cfg_path << "\n";
    return 1;
  }

  json settings;
  TimelineParams timeline_params;
  ScoringParams scoring_params;
  StoreParams store_params;
  try {
    cfg >> settings;
    timeline_params =
        TimelineParams::from_json(settings.value("timeline", json::object()));
    scoring_params =
        ScoringParams::from_json(settings.value("scoring", json::object()));
    store_params =
        StoreParams::from_json(settings.value("mysql", json::object()));
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] Invalid configuration in " << cfg_path << ": "
              << e.what() << "\n";
    return 1;
  }
  if (const char *pass = std::getenv("TIMELINE_DB_PASS"))
    store_params.password = pass;

  const json server_cfg = settings.value("server", json::object());
  int port = server_cfg.value("port", 5005);
  std::cout << "[DEBUG] Starting server on port " << port << std::endl;

  // ---------------------- Database connection -----------------------------
  std::unique_ptr<MySQLTimelineStore> store;
  SegmentId first_id = 1;
  if (store_params.enabled) {
    try {
      store = std::make_unique<MySQLTimelineStore>(
          store_params.uri, store_params.user, store_params.password,
          store_params.schema);
      first_id = store->max_segment_id() + 1;
    } catch (const std::exception &e) {
      std::cerr << "[main] timeline archive unavailable: " << e.what() << "\n";
      return 1;
    }
  }
  std::unique_ptr<TimelineArchiver> archiver;
  if (store)
    archiver = std::make_unique<TimelineArchiver>(*store);

  // ---------------------- Timeline engine ---------------------------------
  DefaultScoringPolicy policy(scoring_params);
  TimelineManager timeline(policy, timeline_params, first_id);
  std::mutex engine_mutex;
  if (archiver)
    timeline.addObserver(archiver.get());

  if (server_cfg.value("record_on_start", true))
    timeline.startRecording();

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 16ull); // 16MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  HttpHandler handler(timeline, engine_mutex, store.get());

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &ep : server_cfg.value("post_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      handler.callPostHandler(action, req, res);
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &ep : server_cfg.value("get_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      handler.callGetHandler(action, req, res);
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[main] failed to listen on port " << port << "\n";
    return 1;
  }
  return 0;
}
