#include "Settings.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using nlohmann::json;

namespace sdi {

std::string getEnvOr(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

Settings applyConfig(Settings base, const json& j) {
  if (!j.is_object()) throw std::runtime_error("config root must be a JSON object");
  try {
    if (j.contains("db_path"))          base.dbPath = j["db_path"].get<std::string>();
    if (j.contains("output_directory")) base.outputDirectory = j["output_directory"].get<std::string>();
    if (j.contains("port"))             base.port = j["port"].get<int>();
    if (j.contains("api_key"))          base.apiKey = j["api_key"].get<std::string>();
    if (j.contains("log_level"))        base.logLevel = j["log_level"].get<std::string>();
    if (j.contains("poll_interval_ms")) base.pollIntervalMs = j["poll_interval_ms"].get<int>();
    if (j.contains("name_cutoff"))      base.match.nameCutoff = j["name_cutoff"].get<double>();
    if (j.contains("time_tolerance_seconds"))
      base.match.timeToleranceSeconds = j["time_tolerance_seconds"].get<double>();
    if (j.contains("nav_project_tolerance_seconds"))
      base.match.navProjectToleranceSeconds = j["nav_project_tolerance_seconds"].get<double>();
    if (j.contains("watch_folders")) {
      base.watchFolders.clear();
      for (const auto& w : j["watch_folders"]) {
        WatchFolder f;
        if (w.is_string()) {
          f.path = w.get<std::string>();
        } else {
          f.path = w.at("path").get<std::string>();
          f.recursive = w.value("recursive", true);
        }
        base.watchFolders.push_back(f);
      }
    }
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("invalid config: ") + e.what());
  }
  return base;
}

Settings loadSettings() {
  Settings s;
  s.dbPath = getEnvOr("SDI_DB_PATH", s.dbPath);
  s.outputDirectory = getEnvOr("SDI_OUTPUT_DIR", s.outputDirectory);
  s.apiKey = getEnvOr("SDI_API_KEY", s.apiKey);
  s.logLevel = getEnvOr("SDI_LOG_LEVEL", s.logLevel);
  try {
    s.port = std::stoi(getEnvOr("SDI_PORT", std::to_string(s.port)));
  } catch (const std::exception&) {
    spdlog::warn("SDI_PORT is not a number, using {}", s.port);
  }

  const std::string configPath = getEnvOr("SDI_CONFIG", "");
  if (!configPath.empty()) {
    std::ifstream in(configPath);
    if (!in) throw std::runtime_error("Cannot open config file: " + configPath);
    json j;
    try {
      in >> j;
    } catch (const json::exception& e) {
      throw std::runtime_error("Cannot parse config file " + configPath + ": " + e.what());
    }
    s = applyConfig(std::move(s), j);
  }
  return s;
}

} // namespace sdi
