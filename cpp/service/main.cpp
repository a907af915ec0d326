// src/main.cpp
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "httplib.h"

#include "docpdf/config.h"
#include "docpdf/engine.h"
#include "docpdf/log.h"
#include "docpdf/pipeline.h"
#include "docpdf/workspace.h"

#include "http_routes.h"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
  docpdf::Config cfg;
  try {
    cfg = docpdf::load_config(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "docpdf: " << e.what() << "\n"
              << "Usage: docpdf_service [work_root] [--host H] [--port N]\n";
    return 1;
  }
  docpdf::set_log_level(cfg.log_level);

  if (cfg.api_key) {
    docpdf::log_info("auth_enabled", {{"header", API_KEY_HEADER}});
  } else {
    docpdf::log_warn("auth_disabled", {{"reason", "API_KEY not set"}});
  }

  std::error_code ec;
  fs::create_directories(cfg.work_root, ec);
  if (ec) {
    docpdf::log_error("work_root_unusable", {{"dir", cfg.work_root.string()}, {"err", ec.message()}});
    return 1;
  }

  docpdf::WorkspaceManager workspaces{cfg.work_root};
  docpdf::SofficeEngine engine{cfg.engine_bin, cfg.engine_timeout_sec};
  const docpdf::ConversionPipeline pipeline{workspaces, engine};

  httplib::Server app;
  // bodies without Content-Length are cut off while streaming
  app.set_payload_max_length((size_t)cfg.max_body_bytes);
  if (cfg.worker_threads > 0) {
    const size_t n = cfg.worker_threads;
    app.new_task_queue = [n] { return new httplib::ThreadPool(n); };
  }

  install_routes(app, cfg, pipeline);

  docpdf::log_info("listening", {
    {"host", cfg.host},
    {"port", std::to_string(cfg.port)},
    {"work_root", workspaces.root().string()},
    {"engine", cfg.engine_bin},
    {"timeout_sec", std::to_string(cfg.engine_timeout_sec)},
  });

  if (!app.listen(cfg.host, cfg.port)) {
    docpdf::log_error("listen_failed", {{"host", cfg.host}, {"port", std::to_string(cfg.port)}});
    return 1;
  }
  return 0;
}
