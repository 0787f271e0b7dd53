#include "Intelligence.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/common/Errors.hpp"
#include "core/common/Paths.hpp"

using nlohmann::json;

namespace sdi {

namespace {

const std::vector<std::string> kMultibeamExtensions = {".all", ".kmall"};
// people keep mixing these up, the content decides sbet vs smrmsg
const std::vector<std::string> kNavigationExtensions = {".out", ".sbet", ".smrmsg"};
const std::vector<std::string> kExportLogExtensions = {".txt", ".log"};
const std::vector<std::string> kSvpExtensions = {".svp"};

bool oneOf(const std::vector<std::string>& exts, const std::string& ext) {
  return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

json groupsJson(const GroupMap& groups) {
  json j = json::object();
  for (const auto& kv : groups) j[kv.first] = kv.second;
  return j;
}

} // namespace

const char* toString(IngestStatus s) {
  switch (s) {
    case IngestStatus::Added:       return "added";
    case IngestStatus::Removed:     return "removed";
    case IngestStatus::Duplicate:   return "duplicate";
    case IngestStatus::Unsupported: return "unsupported";
    case IngestStatus::NotFound:    return "not_found";
  }
  return "unsupported";
}

Intelligence::Intelligence(std::shared_ptr<const FileGatherer> gatherer, Settings settings)
  : gatherer_(std::move(gatherer)), settings_(std::move(settings)), matcher_(settings_.match) {
  if (!gatherer_) throw std::invalid_argument("Intelligence needs a file gatherer");
}

void Intelligence::setProject(std::shared_ptr<Project> project) {
  project_ = std::move(project);
  rerun({true, true, true});
  regenerateProcessingActions();
  actions_.notifyObservers();
}

template <typename Store>
IngestResult Intelligence::ingest(Store& store, FileCategory category, json attrs) {
  IngestResult result;
  result.category = category;
  result.path = attrs.value("path", std::string());
  const uint64_t uid = nextUniqueId_++;
  attrs["unique_id"] = uid;
  if (store.addRecord(attrs)) {
    result.status = IngestStatus::Added;
    result.uniqueId = uid;
  } else {
    result.status = IngestStatus::Duplicate;
  }
  return result;
}

IngestResult Intelligence::addFile(const std::string& path) {
  const std::string norm = paths::normalize(path);
  const std::string ext = paths::extension(norm);
  IngestResult result;
  result.path = norm;
  RerunFlags flags;

  if (oneOf(kMultibeamExtensions, ext)) {
    result = ingest(multibeam_, FileCategory::Multibeam, gatherer_->gatherMultibeam(norm));
    flags.mbes = result.status == IngestStatus::Added;
  } else if (oneOf(kSvpExtensions, ext)) {
    result = ingest(svp_, FileCategory::Svp, gatherer_->gatherSvp(norm));
    flags.svp = result.status == IngestStatus::Added;
  } else if (oneOf(kNavigationExtensions, ext)) {
    switch (gatherer_->sniffNavigation(norm)) {
      case NavFormat::Navigation:
        result = ingest(nav_, FileCategory::Navigation, gatherer_->gatherNavigation(norm));
        break;
      case NavFormat::NavError:
        result = ingest(navError_, FileCategory::NavError, gatherer_->gatherNavError(norm));
        break;
      case NavFormat::Neither:
        spdlog::warn("File is neither a navigation nor a navigation error file: {}", norm);
        return result;
    }
    flags.nav = result.status == IngestStatus::Added;
  } else if (oneOf(kExportLogExtensions, ext)) {
    auto attrs = gatherer_->gatherExportLog(norm);
    if (!attrs) {
      spdlog::debug("Text file is not a navigation export log: {}", norm);
      return result;
    }
    result = ingest(navLog_, FileCategory::NavExportLog, std::move(*attrs));
    flags.nav = result.status == IngestStatus::Added;
  } else {
    spdlog::error("File is not of a supported type: {}", norm);
    return result;
  }

  if (flags.any()) rerun(flags);
  return result;
}

IngestResult Intelligence::removeFile(const std::string& path) {
  IngestResult result;
  result.path = paths::normalize(path);
  result.status = IngestStatus::NotFound;
  RerunFlags flags;

  auto take = [&](auto& store, FileCategory category) {
    if (result.category || !store.contains(result.path)) return;
    result.uniqueId = store.removeRecord(result.path);
    result.category = category;
    result.status = IngestStatus::Removed;
  };
  take(multibeam_, FileCategory::Multibeam);
  take(svp_, FileCategory::Svp);
  take(nav_, FileCategory::Navigation);
  take(navError_, FileCategory::NavError);
  take(navLog_, FileCategory::NavExportLog);

  if (!result.category) return result;
  switch (*result.category) {
    case FileCategory::Multibeam: flags.mbes = true; break;
    case FileCategory::Svp:       flags.svp = true; break;
    default:                      flags.nav = true; break;
  }
  rerun(flags);
  return result;
}

void Intelligence::handleMonitorEvent(const std::string& path, MonitorEvent event) {
  try {
    if (event == MonitorEvent::Deleted) {
      removeFile(path);
    } else {
      addFile(path);
    }
  } catch (const CorruptSourceFile& e) {
    spdlog::warn("Skipping {}: {}", path, e.what());
  } catch (const std::exception& e) {
    spdlog::error("Skipping {} event for {}: {}", toString(event), path, e.what());
  }
}

void Intelligence::runMatchers(RerunFlags flags) {
  if (flags.mbes) matcher_.matchMultibeamToProject(multibeam_, project_.get());
  if (flags.nav) {
    // project matching needs fresh error/log pairs
    matcher_.matchNavErrorToNav(navError_, nav_);
    matcher_.matchExportLogToNav(navLog_, nav_);
    matcher_.matchNavToProject(nav_, navError_, navLog_, project_.get());
  }
  if (flags.svp) matcher_.matchSvpToProject(svp_, project_.get());
}

Snapshot Intelligence::currentSnapshot() const {
  Snapshot s;
  s.lineGroups = multibeam_.lineGroups();
  s.navGroups = nav_.navGroups();
  s.navErrorMatches = navError_.matchingSbet();
  s.navLogMatches = navLog_.matchingSbet();
  s.svpGroups = svp_.svpGroups();
  return s;
}

void Intelligence::rerun(RerunFlags flags, RerunFlags forceRegenerate) {
  runMatchers(flags);
  Snapshot fresh = currentSnapshot();
  bool regenerated = false;
  if (forceRegenerate.mbes || (flags.mbes && !fresh.sameMultibeam(snapshot_))) {
    regenerateConvertActions();
    regenerated = true;
  }
  if (forceRegenerate.nav || (flags.nav && !fresh.sameNavigation(snapshot_))) {
    regenerateNavigationActions();
    regenerated = true;
  }
  if (forceRegenerate.svp || (flags.svp && !fresh.sameSvp(snapshot_))) {
    regenerateSvpActions();
    regenerated = true;
  }
  rebuildUnmatched();
  snapshot_ = std::move(fresh);
  if (regenerated) actions_.notifyObservers();
}

void Intelligence::regenerateConvertActions() {
  const auto& groups = multibeam_.lineGroups();
  std::vector<std::string> destinations;
  for (const auto& kv : groups) destinations.push_back(kv.first);
  const auto current = actions_.updateActionsFromDestinationList(ActionType::Convert, destinations);
  const InstanceMap instances = project_ ? project_->instances() : InstanceMap{};

  for (const auto& kv : groups) {
    const bool existing = instances.count(kv.first) > 0;
    const std::string text = "Convert " + std::to_string(kv.second.size()) + " multibeam file(s) to " +
                             (existing ? "" : "new container ") + kv.first;
    if (std::find(current.second.begin(), current.second.end(), kv.first) != current.second.end()) {
      ActionFields fields;
      fields.inputFiles = kv.second;
      fields.text = text;
      actions_.updateAction(ActionType::Convert, kv.first, fields);
    } else {
      Action a;
      a.type = ActionType::Convert;
      a.outputDestination = kv.first;
      a.inputFiles = kv.second;
      a.text = text;
      actions_.addAction(std::move(a));
    }
  }
}

void Intelligence::regenerateNavigationActions() {
  const auto& groups = nav_.navGroups();
  std::vector<std::string> destinations;
  for (const auto& kv : groups) destinations.push_back(kv.first);
  const auto current = actions_.updateActionsFromDestinationList(ActionType::Navigation, destinations);

  for (const auto& kv : groups) {
    std::vector<std::string> errors, logs;
    for (const auto& navPath : kv.second) {
      auto e = navError_.sbetLookup().find(navPath);
      auto l = navLog_.sbetLookup().find(navPath);
      if (e == navError_.sbetLookup().end() || l == navLog_.sbetLookup().end()) {
        throw ConsistencyViolation("navigation file " + navPath + " is grouped without an error file and export log");
      }
      errors.push_back(e->second);
      logs.push_back(l->second);
    }
    const std::string text = "Import " + std::to_string(kv.second.size()) + " navigation file(s) into " + kv.first;
    if (std::find(current.second.begin(), current.second.end(), kv.first) != current.second.end()) {
      ActionFields fields;
      fields.inputFiles = kv.second;
      fields.errorFiles = errors;
      fields.logFiles = logs;
      fields.text = text;
      actions_.updateAction(ActionType::Navigation, kv.first, fields);
    } else {
      Action a;
      a.type = ActionType::Navigation;
      a.outputDestination = kv.first;
      a.inputFiles = kv.second;
      a.errorFiles = std::move(errors);
      a.logFiles = std::move(logs);
      a.text = text;
      actions_.addAction(std::move(a));
    }
  }
}

void Intelligence::regenerateSvpActions() {
  const auto& groups = svp_.svpGroups();
  std::vector<std::string> destinations;
  for (const auto& kv : groups) destinations.push_back(kv.first);
  const auto current = actions_.updateActionsFromDestinationList(ActionType::Svp, destinations);

  for (const auto& kv : groups) {
    const std::string text = "Import " + std::to_string(kv.second.size()) + " sound velocity file(s) into " + kv.first;
    if (std::find(current.second.begin(), current.second.end(), kv.first) != current.second.end()) {
      ActionFields fields;
      fields.inputFiles = kv.second;
      fields.text = text;
      actions_.updateAction(ActionType::Svp, kv.first, fields);
    } else {
      Action a;
      a.type = ActionType::Svp;
      a.outputDestination = kv.first;
      a.inputFiles = kv.second;
      a.text = text;
      actions_.addAction(std::move(a));
    }
  }
}

void Intelligence::regenerateProcessingActions() {
  std::map<std::string, ProcessingStep> outstanding;
  if (project_) {
    for (const auto& kv : project_->instances()) {
      if (!kv.second) continue;
      const ProcessingStep step = kv.second->nextRequiredStep();
      if (step != ProcessingStep::Complete) outstanding[kv.first] = step;
    }
  }
  std::vector<std::string> destinations;
  for (const auto& kv : outstanding) destinations.push_back(kv.first);
  const auto current = actions_.updateActionsFromDestinationList(ActionType::Processing, destinations);

  for (const auto& kv : outstanding) {
    const std::string text = std::string("Process ") + kv.first + " starting at " + toString(kv.second);
    if (std::find(current.second.begin(), current.second.end(), kv.first) != current.second.end()) {
      ActionFields fields;
      fields.step = kv.second;
      fields.text = text;
      actions_.updateAction(ActionType::Processing, kv.first, fields);
    } else {
      Action a;
      a.type = ActionType::Processing;
      a.outputDestination = kv.first;
      a.step = kv.second;
      a.text = text;
      actions_.addAction(std::move(a));
    }
  }
}

void Intelligence::rebuildUnmatched() {
  UnmatchedMap all;
  for (const auto* m : {&multibeam_.unmatchedFiles(), &nav_.unmatchedFiles(), &navError_.unmatchedFiles(),
                        &navLog_.unmatchedFiles(), &svp_.unmatchedFiles()}) {
    all.insert(m->begin(), m->end());
  }
  unmatched_ = std::move(all);
}

void Intelligence::regenerateActions() {
  matcher_.matchNavErrorToNav(navError_, nav_);
  matcher_.matchExportLogToNav(navLog_, nav_);
  matcher_.matchNavToProject(nav_, navError_, navLog_, project_.get());
  matcher_.matchSvpToProject(svp_, project_.get());

  regenerateProcessingActions();
  regenerateSvpActions();
  regenerateNavigationActions();
  rebuildUnmatched();

  Snapshot fresh = currentSnapshot();
  fresh.lineGroups = snapshot_.lineGroups;
  snapshot_ = std::move(fresh);
  actions_.notifyObservers();
}

InstanceHandle Intelligence::executeAction(std::size_t index) {
  if (!project_) throw std::runtime_error("no project loaded, cannot execute actions");
  if (index >= actions_.size()) {
    throw std::out_of_range("no action at index " + std::to_string(index));
  }
  const Action action = actions_.actions()[index];
  // persisted before the action leaves the queue
  InstanceHandle result = actions_.executeAction(index, engine_, settings_,
    [this](const Action& done, const InstanceHandle& instance) {
      if (!instance) {
        throw std::runtime_error(std::string(toString(done.type)) + " action for " + done.outputDestination +
                                 " returned no container");
      }
      project_->storeInstance(done.outputDestination, instance);
    });

  RerunFlags flags;
  switch (action.type) {
    case ActionType::Convert:    flags = {true, true, true}; break;  // a new container can attract everything
    case ActionType::Navigation: flags.nav = true; break;
    case ActionType::Svp:        flags.svp = true; break;
    case ActionType::Processing: break;
  }
  RerunFlags force;
  force.mbes = action.type == ActionType::Convert;
  force.nav = action.type == ActionType::Navigation;
  force.svp = action.type == ActionType::Svp;
  rerun(flags, force);
  regenerateProcessingActions();
  actions_.notifyObservers();
  return result;
}

void Intelligence::clear() {
  multibeam_.clear();
  nav_.clear();
  navError_.clear();
  navLog_.clear();
  svp_.clear();
  actions_.clear();
  snapshot_ = Snapshot{};
  unmatched_.clear();
  actions_.notifyObservers();
}

void Intelligence::startFolderMonitor(const std::string& folder, bool recursive) {
  const std::string norm = paths::normalize(folder);
  std::error_code ec;
  if (!std::filesystem::is_directory(norm, ec)) {
    throw std::invalid_argument("Unable to start monitoring, path provided is not a valid directory: " + norm);
  }
  // no restart on a monitor, replace it
  stopFolderMonitor(norm);
  auto monitor = std::make_unique<DirectoryMonitor>(norm, recursive);
  monitor->bindTo([this](const std::string& path, MonitorEvent event) { handleMonitorEvent(path, event); });
  monitor->start();
  monitors_[norm] = std::move(monitor);
}

void Intelligence::stopFolderMonitor(const std::string& folder) {
  auto it = monitors_.find(paths::normalize(folder));
  if (it == monitors_.end()) return;
  it->second->stop();
  monitors_.erase(it);
}

std::size_t Intelligence::pollMonitors() {
  std::size_t events = 0;
  for (auto& kv : monitors_) events += kv.second->poll();
  return events;
}

std::vector<std::string> Intelligence::monitoredFolders() const {
  std::vector<std::string> out;
  for (const auto& kv : monitors_) out.push_back(kv.first);
  return out;
}

json Intelligence::filesJson() const {
  return json{
    {toString(FileCategory::Multibeam), multibeam_.toJson()},
    {toString(FileCategory::Navigation), nav_.toJson()},
    {toString(FileCategory::NavError), navError_.toJson()},
    {toString(FileCategory::NavExportLog), navLog_.toJson()},
    {toString(FileCategory::Svp), svp_.toJson()}
  };
}

json Intelligence::associationsJson() const {
  return json{
    {"line_groups", groupsJson(multibeam_.lineGroups())},
    {"nav_groups", groupsJson(nav_.navGroups())},
    {"svp_groups", groupsJson(svp_.svpGroups())},
    {"error_matching_sbet", navError_.matchingSbet()},
    {"log_matching_sbet", navLog_.matchingSbet()}
  };
}

} // namespace sdi
