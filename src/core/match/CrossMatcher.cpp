#include "CrossMatcher.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <set>

#include <spdlog/spdlog.h>

#include "core/common/TimeUtil.hpp"
#include "core/match/Matchers.hpp"

namespace sdi {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// export logs record the sbet path as written on the processing machine,
// which may use either separator
std::string baseName(const std::string& p) {
  const auto pos = p.find_last_of("/\\");
  return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string fmtSeconds(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%g", v);
  return buf;
}

// path of the first navigation row whose file name is `name`
std::string pathOfName(const NavigationStore& nav, const std::string& name) {
  for (const auto& p : nav.filePaths()) {
    if (nav.find(p)->fileName == name) return p;
  }
  return std::string();
}

void addNameEvidence(std::vector<std::string>& evidence,
                     const NavigationStore& nav,
                     const std::vector<std::string>& navNames,
                     const std::string& target,
                     double cutoff) {
  if (target.empty()) return;
  if (auto best = match::nameSimilarity(navNames, target, cutoff)) {
    evidence.push_back(pathOfName(nav, *best));
  }
}

// Shared tail of the error/log to sbet passes: vote, refuse to pair one sbet
// twice, record the reason otherwise.
void resolveSbetVote(const std::string& path,
                     const std::vector<std::string>& evidence,
                     const std::string& noMatchReason,
                     LinkMap& matches,
                     std::set<std::string>& claimed,
                     UnmatchedMap& unmatched) {
  auto winner = match::majorityVote(evidence);
  if (!winner) {
    unmatched[path] = noMatchReason;
    return;
  }
  if (claimed.count(*winner)) {
    unmatched[path] = "Best matching navigation file " + *winner +
                      " is already paired with another file of this type";
    return;
  }
  claimed.insert(*winner);
  matches[path] = *winner;
}

bool allCastsKnown(const std::vector<double>& casts, const std::vector<double>& known) {
  for (double c : casts) {
    const auto sec = std::llround(c);
    bool found = false;
    for (double k : known) {
      if (std::llround(k) == sec) { found = true; break; }
    }
    if (!found) return false;
  }
  return true;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

std::string newContainerName(const MultibeamRecord& r) {
  return r.sonarModel + "_" + std::to_string(r.primarySerial) + "_" + timeutil::folderDate(r.dataStartUtc);
}

void CrossMatcher::matchNavErrorToNav(NavErrorStore& errors, const NavigationStore& nav) const {
  const auto& navPaths = nav.filePaths();
  const auto navNames = nav.fileNames();
  std::vector<match::TimeWindow> windows;
  windows.reserve(navPaths.size());
  for (const auto& p : navPaths) {
    const auto* row = nav.find(p);
    windows.emplace_back(row->weeklySecondsStart, row->weeklySecondsEnd);
  }

  LinkMap matches;
  UnmatchedMap unmatched;
  std::set<std::string> claimed;
  const std::string noMatch =
      "No navigation file with a similar file name (ratio >= " + fmtSeconds(settings_.nameCutoff) +
      "), in the same folder, or with start and end times within " +
      fmtSeconds(settings_.timeToleranceSeconds) + " seconds of this error file";

  for (const auto& path : errors.filePaths()) {
    const auto* row = errors.find(path);
    if (navPaths.empty()) {
      unmatched[path] = "No navigation files have been added to match this error file against";
      continue;
    }
    std::vector<std::string> evidence;
    addNameEvidence(evidence, nav, navNames, row->fileName, settings_.nameCutoff);
    for (const auto& p : match::filesystemProximity(navPaths, path)) evidence.push_back(p);
    const match::TimeWindow target{row->weeklySecondsStart, row->weeklySecondsEnd};
    for (auto idx : match::timeWindowOverlap(windows, target, settings_.timeToleranceSeconds)) {
      evidence.push_back(navPaths[idx]);
    }
    resolveSbetVote(path, evidence, noMatch, matches, claimed, unmatched);
  }

  spdlog::debug("nav error matching: {} matched, {} unmatched", matches.size(), unmatched.size());
  errors.setAssociations(std::move(matches), std::move(unmatched));
}

void CrossMatcher::matchExportLogToNav(NavExportLogStore& logs, const NavigationStore& nav) const {
  const auto& navPaths = nav.filePaths();
  const auto navNames = nav.fileNames();

  LinkMap matches;
  UnmatchedMap unmatched;
  std::set<std::string> claimed;
  const std::string noMatch =
      "No navigation file with a file name similar (ratio >= " + fmtSeconds(settings_.nameCutoff) +
      ") to this log or to the exported file name it records, and none in the same folder";

  for (const auto& path : logs.filePaths()) {
    const auto* row = logs.find(path);
    if (navPaths.empty()) {
      unmatched[path] = "No navigation files have been added to match this export log against";
      continue;
    }
    std::vector<std::string> evidence;
    addNameEvidence(evidence, nav, navNames, row->fileName, settings_.nameCutoff);
    addNameEvidence(evidence, nav, navNames, baseName(row->exportedSbetFileName), settings_.nameCutoff);
    for (const auto& p : match::filesystemProximity(navPaths, path)) evidence.push_back(p);
    resolveSbetVote(path, evidence, noMatch, matches, claimed, unmatched);
  }

  spdlog::debug("export log matching: {} matched, {} unmatched", matches.size(), unmatched.size());
  logs.setAssociations(std::move(matches), std::move(unmatched));
}

void CrossMatcher::matchMultibeamToProject(MultibeamStore& mbes, const Project* project) const {
  GroupMap groups;
  FqprMatchMap fqpr;
  UnmatchedMap unmatched;

  for (const auto& path : mbes.filePaths()) {
    const auto* row = mbes.find(path);
    if (!project) {
      const std::string key = newContainerName(*row);
      groups[key].push_back(path);
      fqpr[path] = "";
      unmatched[path] = "No project loaded, unable to match by serial number and date; line will be "
                        "converted into a new container " + key;
      continue;
    }
    auto found = project->lookupInstanceBySerial(row->primarySerial, row->secondarySerial, row->dataStartUtc);
    if (found.second) {
      fqpr[path] = found.first;
      if (!contains(found.second->importedFiles(FileCategory::Multibeam), row->fileName)) {
        groups[found.first].push_back(path);
      }
      continue;
    }
    const std::string key = newContainerName(*row);
    groups[key].push_back(path);
    fqpr[path] = "";
    unmatched[path] = "No container in the project with serial number " + std::to_string(row->primarySerial) +
                      "/" + std::to_string(row->secondarySerial) + " and data on " +
                      timeutil::folderDate(row->dataStartUtc) + "; line will be converted into a new container " + key;
  }

  spdlog::debug("multibeam matching: {} line groups", groups.size());
  mbes.setAssociations(std::move(groups), std::move(fqpr), std::move(unmatched));
}

void CrossMatcher::matchNavToProject(NavigationStore& nav,
                                     const NavErrorStore& errors,
                                     const NavExportLogStore& logs,
                                     const Project* project) const {
  GroupMap groups;
  FqprMatchMap fqpr;
  UnmatchedMap unmatched;
  const InstanceMap instances = project ? project->instances() : InstanceMap{};

  for (const auto& path : nav.filePaths()) {
    const auto* row = nav.find(path);
    fqpr[path] = "";

    const bool hasError = errors.sbetLookup().count(path) > 0;
    const bool hasLog = logs.sbetLookup().count(path) > 0;
    if (!hasError || !hasLog) {
      std::string missing;
      if (!hasError) missing = "a matching navigation error (smrmsg) file";
      if (!hasLog) missing += std::string(missing.empty() ? "" : " and ") + "a matching export log";
      unmatched[path] = "Navigation file needs both an error file and an export log before it can be "
                        "matched to the project; missing " + missing;
      continue;
    }
    if (!project) {
      unmatched[path] = "No project loaded to match this navigation file against";
      continue;
    }
    if (instances.empty()) {
      unmatched[path] = "Project has no converted containers to match this navigation file against";
      continue;
    }

    std::string importedBy;
    for (const auto& kv : instances) {
      if (contains(kv.second->importedFiles(FileCategory::Navigation), row->fileName)) {
        importedBy = kv.first;
        break;
      }
    }
    if (!importedBy.empty()) {
      fqpr[path] = importedBy;
      unmatched[path] = "Navigation file already imported into " + importedBy;
      continue;
    }

    // every occurrence counts, not every kind of evidence
    std::vector<std::string> evidence;
    const std::string lowerPath = lower(path);
    for (const auto& kv : instances) {
      const auto& inst = kv.second;
      const double instWeekly = timeutil::weeklySeconds(inst->dataStartUtc());
      if (timeutil::weeklyDistance(instWeekly, row->weeklySecondsStart) <= settings_.navProjectToleranceSeconds) {
        evidence.push_back(kv.first);
      }
      for (int serial : inst->serialNumbers()) {
        if (serial != 0 && path.find(std::to_string(serial)) != std::string::npos) evidence.push_back(kv.first);
      }
      const std::string model = lower(inst->modelNumber());
      if (!model.empty() && lowerPath.find(model) != std::string::npos) evidence.push_back(kv.first);
    }

    auto winner = match::majorityVote(evidence);
    if (!winner) {
      unmatched[path] = "No container starts within " + fmtSeconds(settings_.navProjectToleranceSeconds) +
                        " seconds of week of this navigation file, and no container serial number or "
                        "sonar model appears in its path";
      continue;
    }
    groups[*winner].push_back(path);
    fqpr[path] = *winner;
  }

  spdlog::debug("navigation matching: {} nav groups", groups.size());
  nav.setAssociations(std::move(groups), std::move(fqpr), std::move(unmatched));
}

void CrossMatcher::matchSvpToProject(SvpStore& svp, const Project* project) const {
  GroupMap groups;
  std::map<std::string, std::vector<std::string>> fqpr;
  UnmatchedMap unmatched;
  const InstanceMap instances = project ? project->instances() : InstanceMap{};

  for (const auto& path : svp.filePaths()) {
    const auto* row = svp.find(path);
    fqpr[path] = {};
    if (instances.empty()) {
      unmatched[path] = project ? "Project has no converted containers to apply this cast file to"
                                : "No project loaded to match this cast file against";
      continue;
    }
    for (const auto& kv : instances) {
      if (!allCastsKnown(row->castTimes, kv.second->castTimes())) {
        groups[kv.first].push_back(path);
        fqpr[path].push_back(kv.first);
      }
    }
    if (fqpr[path].empty()) {
      unmatched[path] = "Every cast in this file already exists in every container in the project";
    }
  }

  spdlog::debug("svp matching: {} svp groups", groups.size());
  svp.setAssociations(std::move(groups), std::move(fqpr), std::move(unmatched));
}

} // namespace sdi
