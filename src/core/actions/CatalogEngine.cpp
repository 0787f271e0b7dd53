#include "CatalogEngine.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/common/Paths.hpp"
#include "core/project/CatalogInstance.hpp"

namespace sdi {

namespace {

InstanceRecord existingRecord(const Project& project, const std::string& destination, bool required) {
  const auto instances = project.instances();
  auto it = instances.find(destination);
  if (it == instances.end() || !it->second) {
    if (required) throw std::runtime_error("no container " + destination + " in the project");
    InstanceRecord r;
    r.key = destination;
    return r;
  }
  return toInstanceRecord(destination, *it->second);
}

void addName(std::vector<std::string>& names, const std::string& path) {
  const std::string name = paths::fileName(path);
  if (std::find(names.begin(), names.end(), name) == names.end()) names.push_back(name);
}

// imports invalidate everything from `step` on
void rollBackTo(InstanceRecord& r, ProcessingStep step) {
  if (static_cast<int>(r.nextStep) > static_cast<int>(step)) r.nextStep = step;
}

} // namespace

ActionEngine makeCatalogEngine(std::shared_ptr<const Project> project,
                               std::shared_ptr<const FileGatherer> gatherer) {
  if (!project || !gatherer) throw std::invalid_argument("catalog engine needs a project and a gatherer");
  ActionEngine engine;

  engine.convert = [project, gatherer](const std::string& destination,
                                       const std::vector<std::string>& lineFiles,
                                       const Settings&) -> InstanceHandle {
    InstanceRecord r = existingRecord(*project, destination, false);
    const bool created = r.model.empty();
    for (const auto& line : lineFiles) {
      const auto info = gatherer->gatherMultibeam(line);
      const double start = info.value("data_start_utc", 0.0);
      if (r.model.empty()) {
        r.model = info.value("sonar_model", std::string());
        r.primarySerial = info.value("primary_serial", 0);
        r.secondarySerial = info.value("secondary_serial", 0);
        r.dataStartUtc = start;
      } else {
        r.dataStartUtc = std::min(r.dataStartUtc, start);
      }
      addName(r.multibeamFiles, line);
    }
    r.nextStep = ProcessingStep::Orientation;
    spdlog::info("{} {} with {} lines", created ? "Created container" : "Appended to container",
                 destination, lineFiles.size());
    return std::make_shared<CatalogInstance>(std::move(r));
  };

  engine.importNavigation = [project](const std::string& destination,
                                      const std::vector<std::string>& navFiles,
                                      const std::vector<std::string>& errorFiles,
                                      const std::vector<std::string>& logFiles,
                                      const Settings&) -> InstanceHandle {
    if (navFiles.size() != errorFiles.size() || navFiles.size() != logFiles.size()) {
      throw std::invalid_argument("navigation import for " + destination +
                                  " needs one error file and one export log per navigation file");
    }
    InstanceRecord r = existingRecord(*project, destination, true);
    for (const auto& nav : navFiles) addName(r.navigationFiles, nav);
    rollBackTo(r, ProcessingStep::Georeference);
    spdlog::info("Imported {} navigation files into {}", navFiles.size(), destination);
    return std::make_shared<CatalogInstance>(std::move(r));
  };

  engine.importSvp = [project, gatherer](const std::string& destination,
                                         const std::vector<std::string>& svpFiles,
                                         const Settings&) -> InstanceHandle {
    InstanceRecord r = existingRecord(*project, destination, true);
    std::size_t added = 0;
    for (const auto& file : svpFiles) {
      const auto info = gatherer->gatherSvp(file);
      for (double t : info.value("cast_times", std::vector<double>{})) {
        const bool known = std::any_of(r.castTimes.begin(), r.castTimes.end(),
                                       [t](double k) { return std::llround(k) == std::llround(t); });
        if (!known) {
          r.castTimes.push_back(t);
          ++added;
        }
      }
      addName(r.svpFiles, file);
    }
    rollBackTo(r, ProcessingStep::SoundVelocity);
    spdlog::info("Imported {} casts into {}", added, destination);
    return std::make_shared<CatalogInstance>(std::move(r));
  };

  engine.process = [project](const std::string& destination, ProcessingStep fromStep,
                             const Settings&) -> InstanceHandle {
    InstanceRecord r = existingRecord(*project, destination, true);
    spdlog::info("Processing {} from {}", destination, toString(fromStep));
    r.nextStep = ProcessingStep::Complete;
    return std::make_shared<CatalogInstance>(std::move(r));
  };

  return engine;
}

} // namespace sdi
