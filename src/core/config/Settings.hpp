#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdi {

struct MatchSettings {
  double nameCutoff = 0.6;                  // similarity ratio for file name evidence
  double timeToleranceSeconds = 2.0;        // nav <-> error start/end tolerance
  double navProjectToleranceSeconds = 86400.0;
};

struct WatchFolder {
  std::string path;
  bool recursive = true;
};

struct Settings {
  std::string dbPath = "data/survey-project.db";
  std::string outputDirectory = "data/project";
  int port = 8080;
  std::string apiKey;          // empty = auth disabled
  std::string logLevel = "info";
  int pollIntervalMs = 2000;
  std::vector<WatchFolder> watchFolders;
  MatchSettings match;
};

// Defaults, then environment (SDI_*), then the JSON file named by SDI_CONFIG.
Settings loadSettings();

// Overrides fields of `base` with the keys present in `j`.
Settings applyConfig(Settings base, const nlohmann::json& j);

std::string getEnvOr(const char* key, const std::string& defval);

} // namespace sdi
