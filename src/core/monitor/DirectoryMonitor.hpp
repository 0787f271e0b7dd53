#pragma once
#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sdi {

enum class MonitorEvent { Created, Deleted };

const char* toString(MonitorEvent e);

/*
  Polling watcher for one folder. The first poll after start() reports every
  file already present as Created; later polls report the difference against
  the previous scan. Callbacks run synchronously inside poll(); an exception
  from a callback is logged and the event counts as delivered.
*/
class DirectoryMonitor {
public:
  using Callback = std::function<void(const std::string& path, MonitorEvent event)>;

  DirectoryMonitor(std::string folder, bool recursive);

  void bindTo(Callback cb) { callbacks_.push_back(std::move(cb)); }
  void start();
  void stop();
  bool isRunning() const { return running_; }
  const std::string& folder() const { return folder_; }
  bool recursive() const { return recursive_; }

  // Number of events emitted.
  std::size_t poll();

private:
  std::set<std::string> scan() const;

  std::string folder_;
  bool recursive_;
  bool running_ = false;
  std::set<std::string> known_;
  std::vector<Callback> callbacks_;
};

} // namespace sdi
