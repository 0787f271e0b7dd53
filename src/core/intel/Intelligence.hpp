#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/actions/ActionContainer.hpp"
#include "core/actions/ActionEngine.hpp"
#include "core/config/Settings.hpp"
#include "core/gather/FileGatherer.hpp"
#include "core/intel/Snapshot.hpp"
#include "core/match/CrossMatcher.hpp"
#include "core/monitor/DirectoryMonitor.hpp"
#include "core/project/Project.hpp"
#include "core/records/CategoryStores.hpp"

namespace sdi {

enum class IngestStatus { Added, Removed, Duplicate, Unsupported, NotFound };

const char* toString(IngestStatus s);

struct IngestResult {
  IngestStatus                status = IngestStatus::Unsupported;
  std::optional<FileCategory> category;
  std::optional<uint64_t>     uniqueId;
  std::string                 path;   // normalized
};

/*
  Entry point of the matching core.

  File events go to the store of their category; the matcher families the
  change touches are rerun and the result is compared with the Snapshot of the
  previous pass. Only families whose association maps changed get their
  actions regenerated, which keeps project queries off the path of events that
  change nothing.

  Not thread safe. Hosts delivering events from several threads must
  serialize every call.
*/
class Intelligence {
public:
  explicit Intelligence(std::shared_ptr<const FileGatherer> gatherer, Settings settings = {});

  // Rematches everything against the new project (may be null).
  void setProject(std::shared_ptr<Project> project);
  const Project* project() const { return project_.get(); }
  void setActionEngine(ActionEngine engine) { engine_ = std::move(engine); }

  // Throws CorruptSourceFile when the gatherer cannot read the file, in which
  // case no store is modified.
  IngestResult addFile(const std::string& path);
  IngestResult removeFile(const std::string& path);
  // Created -> addFile, Deleted -> removeFile. Failures are logged and the
  // event is skipped.
  void handleMonitorEvent(const std::string& path, MonitorEvent event);

  // Runs the action, stores its container in the project and rematches.
  InstanceHandle executeAction(std::size_t index = 0);
  // Processing, svp and navigation actions plus the unmatched list. Line
  // groups are only rebuilt from file events.
  void regenerateActions();
  // Empties stores, actions and snapshot. Unique ids keep counting.
  void clear();

  void startFolderMonitor(const std::string& folder, bool recursive = true);
  void stopFolderMonitor(const std::string& folder);
  std::size_t pollMonitors();
  std::vector<std::string> monitoredFolders() const;

  const MultibeamStore& multibeam() const { return multibeam_; }
  const NavigationStore& navigation() const { return nav_; }
  const NavErrorStore& navError() const { return navError_; }
  const NavExportLogStore& navLog() const { return navLog_; }
  const SvpStore& svp() const { return svp_; }
  const ActionContainer& actions() const { return actions_; }
  const UnmatchedMap& unmatchedFiles() const { return unmatched_; }
  const Settings& settings() const { return settings_; }

  void bindToActionUpdate(ActionContainer::Observer observer) { actions_.bindToActionUpdate(std::move(observer)); }

  nlohmann::json filesJson() const;
  nlohmann::json associationsJson() const;

private:
  struct RerunFlags {
    bool mbes = false;
    bool nav = false;
    bool svp = false;
    bool any() const { return mbes || nav || svp; }
  };

  template <typename Store>
  IngestResult ingest(Store& store, FileCategory category, nlohmann::json attrs);

  void rerun(RerunFlags flags) { rerun(flags, RerunFlags()); }
  void rerun(RerunFlags flags, RerunFlags forceRegenerate);
  void runMatchers(RerunFlags flags);
  Snapshot currentSnapshot() const;

  void regenerateConvertActions();
  void regenerateNavigationActions();
  void regenerateSvpActions();
  void regenerateProcessingActions();
  void rebuildUnmatched();

  std::shared_ptr<const FileGatherer> gatherer_;
  std::shared_ptr<Project> project_;
  Settings settings_;
  CrossMatcher matcher_;
  ActionEngine engine_;

  MultibeamStore multibeam_;
  NavigationStore nav_;
  NavErrorStore navError_;
  NavExportLogStore navLog_;
  SvpStore svp_;

  ActionContainer actions_;
  Snapshot snapshot_;
  UnmatchedMap unmatched_;
  uint64_t nextUniqueId_ = 0;
  std::map<std::string, std::unique_ptr<DirectoryMonitor>> monitors_;
};

} // namespace sdi
