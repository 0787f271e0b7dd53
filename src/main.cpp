// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/actions/CatalogEngine.hpp"
#include "core/config/Settings.hpp"
#include "core/gather/FileGatherer.hpp"
#include "core/intel/Intelligence.hpp"
#include "core/project/ProjectStore.hpp"
#include "core/project/SqliteProject.hpp"
#include "services/api/HttpServer.hpp"

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/project/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in the working directory and src/core/project)");
}

static void ensure_dirs_for(const std::string& file_path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(file_path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init             # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --scan <dir>...    # match the files under each folder, print actions\n"
            << "  " << argv0 << " --serve            # start HTTP server (SDI_PORT or 8080)\n";
}

// Opens (and self-heals) the project database and wires the core to it.
static std::unique_ptr<sdi::Intelligence> open_intelligence(const sdi::Settings& settings) {
  ensure_dirs_for(settings.dbPath);
  sdi::ProjectStore::ensureSchema(settings.dbPath, findSchemaPath());

  auto gatherer = std::make_shared<sdi::FastHeaderGatherer>();
  auto project = std::make_shared<sdi::SqliteProject>(settings.dbPath);

  auto intel = std::make_unique<sdi::Intelligence>(gatherer, settings);
  intel->setActionEngine(sdi::makeCatalogEngine(project, gatherer));
  intel->setProject(project);
  return intel;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const sdi::Settings settings = sdi::loadSettings();
    spdlog::set_level(spdlog::level::from_str(settings.logLevel));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      ensure_dirs_for(settings.dbPath);
      sdi::ProjectStore::ensureSchema(settings.dbPath, findSchemaPath());
      std::cout << "DB initialized at: " << settings.dbPath << "\n";
      return 0;
    }

    if (argc > 2 && std::string(argv[1]) == "--scan") {
      auto intel = open_intelligence(settings);
      for (int i = 2; i < argc; ++i) {
        intel->startFolderMonitor(argv[i], true);
      }
      intel->pollMonitors();

      const nlohmann::json report = {
        {"actions", intel->actions().toJson()},
        {"unmatched", intel->unmatchedFiles()},
        {"associations", intel->associationsJson()}
      };
      std::cout << report.dump(2) << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      auto intel = open_intelligence(settings);
      for (const auto& folder : settings.watchFolders) {
        intel->startFolderMonitor(folder.path, folder.recursive);
      }
      sdi::run_http_server(*intel, settings.port, settings.apiKey, settings.pollIntervalMs);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
