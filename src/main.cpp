// Entry point for the route optimisation HTTP server.  It wires up the
// httplib server, loads configuration and exposes the REST endpoints handled by
// `HttpHandler`.

#include "core/MatrixCache.hpp"
#include "http/http_handler.hpp"
#include "models/Errors.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>

#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <memory>
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

static std::string strip_slash(const std::string &path) {
  return (!path.empty() && path[0] == '/') ? path.substr(1) : path;
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
  EngineConfig defaults;
  try {
    cfg >> settings;
    defaults = EngineConfig::from_json(settings.value("engine", json::object()));
  } catch (const json::exception &e) {
    std::cerr << "[ERROR] Bad settings in " << cfg_path << ": " << e.what()
              << "\n";
    return 1;
  } catch (const ValidationError &e) {
    std::cerr << "[ERROR] Invalid engine settings: " << e.what() << "\n";
    return 1;
  }
  const json server_cfg = settings.value("server", json::object());
  int port = server_cfg.value("port", 5005);
  std::size_t cache_capacity = server_cfg.value("matrix_cache_entries", 16);
  std::cout << "[DEBUG] Starting server on port " << port << std::endl;

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 16ull); // 16MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  auto cache = std::make_shared<MatrixCache>(cache_capacity);
  HttpHandler handler(defaults, cache);

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &ep : server_cfg.value("post_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action = strip_slash(path);
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST λ] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
    std::cout << "[DEBUG] POST " << path << std::endl;
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &ep : server_cfg.value("get_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action = strip_slash(path);
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      handler.callGetHandler(action, req, res);
    });
    std::cout << "[DEBUG] GET  " << path << std::endl;
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[main] listen on port " << port << " failed\n";
    return 1;
  }
  return 0;
}
