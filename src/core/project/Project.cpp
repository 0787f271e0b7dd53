#include "Project.hpp"
#include "core/common/TimeUtil.hpp"

namespace sdi {

const char* toString(ProcessingStep s) {
  switch (s) {
    case ProcessingStep::Orientation:   return "orientation";
    case ProcessingStep::BeamVectors:   return "beam_vectors";
    case ProcessingStep::SoundVelocity: return "sound_velocity";
    case ProcessingStep::Georeference:  return "georeference";
    case ProcessingStep::Tpu:           return "tpu";
    case ProcessingStep::Complete:      return "complete";
  }
  return "complete";
}

std::optional<ProcessingStep> processingStepFromString(const std::string& s) {
  for (auto step : {ProcessingStep::Orientation, ProcessingStep::BeamVectors,
                    ProcessingStep::SoundVelocity, ProcessingStep::Georeference,
                    ProcessingStep::Tpu, ProcessingStep::Complete}) {
    if (s == toString(step)) return step;
  }
  return std::nullopt;
}

std::pair<std::string, InstanceHandle> Project::lookupInstanceBySerial(int primarySerial,
                                                                       int secondarySerial,
                                                                       double sameDayAs) const {
  const int64_t day = timeutil::utcDay(sameDayAs);
  for (const auto& kv : instances()) {
    const auto& inst = kv.second;
    if (!inst) continue;
    const auto serials = inst->serialNumbers();
    const int primary = serials.empty() ? 0 : serials[0];
    const int secondary = serials.size() > 1 ? serials[1] : 0;
    if (primary == primarySerial && secondary == secondarySerial &&
        timeutil::utcDay(inst->dataStartUtc()) == day) {
      return {kv.first, inst};
    }
  }
  return {std::string(), nullptr};
}

} // namespace sdi
