#include "Action.hpp"

namespace sdi {

const char* toString(ActionType t) {
  switch (t) {
    case ActionType::Convert:    return "convert";
    case ActionType::Navigation: return "navigation";
    case ActionType::Svp:        return "svp";
    case ActionType::Processing: return "processing";
  }
  return "unknown";
}

int priorityOf(ActionType t) {
  switch (t) {
    case ActionType::Convert:    return 0;
    case ActionType::Navigation:
    case ActionType::Svp:        return 1;
    case ActionType::Processing: return 2;
  }
  return 2;
}

nlohmann::json toJson(const Action& a) {
  nlohmann::json j = {
    {"type", toString(a.type)},
    {"destination", a.outputDestination},
    {"input_files", a.inputFiles},
    {"text", a.text},
    {"is_running", a.isRunning},
    {"priority", a.priority()}
  };
  if (a.type == ActionType::Navigation) {
    j["error_files"] = a.errorFiles;
    j["log_files"] = a.logFiles;
  }
  if (a.type == ActionType::Processing) j["step"] = toString(a.step);
  return j;
}

} // namespace sdi
