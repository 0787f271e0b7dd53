#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "core/common/Errors.hpp"
#include "core/intel/Intelligence.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static void send_json(httplib::Response& res, const json& body, int status = 200) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static json ingest_json(const sdi::IngestResult& r) {
  json out = {
    {"path", r.path},
    {"status", sdi::toString(r.status)}
  };
  if (r.category) out["category"] = sdi::toString(*r.category);
  if (r.uniqueId) out["unique_id"] = *r.uniqueId;
  return out;
}

// path from a JSON body {"path": ...} or ?path=
static std::string request_path(const httplib::Request& req) {
  if (!req.body.empty()) {
    json j = json::parse(req.body, nullptr, false);
    if (j.is_object() && j.contains("path") && j["path"].is_string()) return j["path"].get<std::string>();
  }
  return param_or(req, "path");
}

// -------- server --------

namespace sdi {

void run_http_server(Intelligence& intel,
                     int port,
                     const std::string& apiKey,
                     int pollIntervalMs) {
  httplib::Server svr;
  std::mutex mu;  // the core is single threaded, every access goes through here
  std::atomic<bool> stopping{false};

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  svr.Get("/files", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    std::lock_guard<std::mutex> lock(mu);
    send_json(res, {{"files", intel.filesJson()}, {"associations", intel.associationsJson()}});
  });

  // POST /files  body {"path": "..."} or ?path=
  svr.Post("/files", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string path = request_path(req);
    if (path.empty()) {
      res.status = 422; res.set_content("path required", "text/plain"); return;
    }
    std::lock_guard<std::mutex> lock(mu);
    try {
      const auto r = intel.addFile(path);
      send_json(res, ingest_json(r), r.status == IngestStatus::Unsupported ? 415 : 200);
    } catch (const CorruptSourceFile& e) {
      res.status = 422;
      res.set_content(e.what(), "text/plain");
    } catch (const std::exception& e) {
      spdlog::error("add {} failed: {}", path, e.what());
      res.status = 500;
      res.set_content(e.what(), "text/plain");
    }
  });

  svr.Delete("/files", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string path = param_or(req, "path");
    if (path.empty()) {
      res.status = 422; res.set_content("path required", "text/plain"); return;
    }
    std::lock_guard<std::mutex> lock(mu);
    try {
      const auto r = intel.removeFile(path);
      send_json(res, ingest_json(r), r.status == IngestStatus::NotFound ? 404 : 200);
    } catch (const std::exception& e) {
      spdlog::error("remove {} failed: {}", path, e.what());
      res.status = 500;
      res.set_content(e.what(), "text/plain");
    }
  });

  svr.Get("/actions", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    std::lock_guard<std::mutex> lock(mu);
    send_json(res, intel.actions().toJson());
  });

  // POST /actions/execute?index=0
  svr.Post("/actions/execute", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    std::size_t index = 0;
    try {
      index = static_cast<std::size_t>(std::stoul(param_or(req, "index", "0")));
    } catch (const std::exception&) {
      res.status = 400; res.set_content("index must be a non-negative integer", "text/plain"); return;
    }
    std::lock_guard<std::mutex> lock(mu);
    try {
      intel.executeAction(index);
      send_json(res, intel.actions().toJson());
    } catch (const std::out_of_range& e) {
      res.status = 404;
      res.set_content(e.what(), "text/plain");
    } catch (const std::exception& e) {
      spdlog::error("execute action {} failed: {}", index, e.what());
      res.status = 500;
      res.set_content(e.what(), "text/plain");
    }
  });

  svr.Post("/actions/regenerate", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    std::lock_guard<std::mutex> lock(mu);
    try {
      intel.regenerateActions();
      send_json(res, intel.actions().toJson());
    } catch (const std::exception& e) {
      spdlog::error("regenerate failed: {}", e.what());
      res.status = 500;
      res.set_content(e.what(), "text/plain");
    }
  });

  svr.Get("/unmatched", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    std::lock_guard<std::mutex> lock(mu);
    send_json(res, intel.unmatchedFiles());
  });

  // POST /monitors  body {"path": "...", "recursive": true}
  svr.Post("/monitors", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    json j = json::parse(req.body, nullptr, false);
    if (!j.is_object() || !j.contains("path") || !j["path"].is_string()) {
      res.status = 400; res.set_content("body must be {\"path\": ..., \"recursive\": bool}", "text/plain"); return;
    }
    const bool recursive = j.contains("recursive") && j["recursive"].is_boolean() ? j["recursive"].get<bool>() : true;
    std::lock_guard<std::mutex> lock(mu);
    try {
      intel.startFolderMonitor(j["path"].get<std::string>(), recursive);
      send_json(res, intel.monitoredFolders());
    } catch (const std::invalid_argument& e) {
      res.status = 422;
      res.set_content(e.what(), "text/plain");
    }
  });

  svr.Delete("/monitors", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    std::lock_guard<std::mutex> lock(mu);
    intel.stopFolderMonitor(param_or(req, "path"));
    send_json(res, intel.monitoredFolders());
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  std::thread poller([&]() {
    while (!stopping) {
      {
        std::lock_guard<std::mutex> lock(mu);
        try {
          intel.pollMonitors();
        } catch (const std::exception& e) {
          spdlog::error("monitor poll failed: {}", e.what());
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(pollIntervalMs));
    }
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
  stopping = true;
  poller.join();
}

} // namespace sdi
