#include "DirectoryMonitor.hpp"
#include <exception>
#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

#include "core/common/Paths.hpp"

namespace fs = std::filesystem;

namespace sdi {

const char* toString(MonitorEvent e) {
  return e == MonitorEvent::Created ? "created" : "deleted";
}

DirectoryMonitor::DirectoryMonitor(std::string folder, bool recursive)
  : folder_(paths::normalize(folder)), recursive_(recursive) {}

void DirectoryMonitor::start() {
  known_.clear();
  running_ = true;
  spdlog::info("now monitoring {}{}", folder_, recursive_ ? " (recursive)" : "");
}

void DirectoryMonitor::stop() {
  running_ = false;
  known_.clear();
  spdlog::info("no longer monitoring {}", folder_);
}

std::set<std::string> DirectoryMonitor::scan() const {
  std::set<std::string> found;
  std::error_code ec;
  auto consider = [&](const fs::directory_entry& entry) {
    std::error_code fec;
    if (entry.is_regular_file(fec)) found.insert(paths::normalize(entry.path().string()));
  };
  if (recursive_) {
    for (fs::recursive_directory_iterator it(folder_, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
      consider(*it);
    }
  } else {
    for (fs::directory_iterator it(folder_, ec), end; !ec && it != end; it.increment(ec)) {
      consider(*it);
    }
  }
  if (ec) spdlog::warn("scan of {} stopped early: {}", folder_, ec.message());
  return found;
}

std::size_t DirectoryMonitor::poll() {
  if (!running_) return 0;
  std::set<std::string> current = scan();
  std::vector<std::pair<std::string, MonitorEvent>> events;
  for (const auto& p : current) {
    if (!known_.count(p)) events.emplace_back(p, MonitorEvent::Created);
  }
  for (const auto& p : known_) {
    if (!current.count(p)) events.emplace_back(p, MonitorEvent::Deleted);
  }
  known_ = std::move(current);
  // one failing handler must not cost the rest of the batch
  for (const auto& ev : events) {
    for (const auto& cb : callbacks_) {
      try {
        cb(ev.first, ev.second);
      } catch (const std::exception& e) {
        spdlog::error("{} event for {} failed: {}", toString(ev.second), ev.first, e.what());
      }
    }
  }
  return events.size();
}

} // namespace sdi
