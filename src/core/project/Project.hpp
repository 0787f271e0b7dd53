#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/records/FileRecord.hpp"

namespace sdi {

// Processing pipeline stages of a converted container, in order.
enum class ProcessingStep { Orientation, BeamVectors, SoundVelocity, Georeference, Tpu, Complete };

const char* toString(ProcessingStep s);
std::optional<ProcessingStep> processingStepFromString(const std::string& s);

// Read side of one converted sensor container.
class FqprInstance {
public:
  virtual ~FqprInstance() = default;

  // primary first, secondary is 0 for single head systems
  virtual std::vector<int> serialNumbers() const = 0;
  virtual std::string modelNumber() const = 0;
  virtual double dataStartUtc() const = 0;
  // file names (not paths) already brought into this container
  virtual std::vector<std::string> importedFiles(FileCategory category) const = 0;
  virtual ProcessingStep nextRequiredStep() const = 0;
  virtual std::vector<double> castTimes() const = 0;
};

using InstanceHandle = std::shared_ptr<FqprInstance>;
using InstanceMap = std::map<std::string, InstanceHandle>;

/*
  The project owns the converted containers, keyed by their storage path
  relative to the project (the same string used as action destination).
*/
class Project {
public:
  virtual ~Project() = default;

  virtual InstanceMap instances() const = 0;

  // Adds or replaces the container at `key` and persists it.
  virtual void storeInstance(const std::string& key, const InstanceHandle& instance) = 0;

  // First container whose serial numbers match and whose data starts on the
  // same UTC day as `sameDayAs`. The handle is null when nothing matches.
  virtual std::pair<std::string, InstanceHandle> lookupInstanceBySerial(int primarySerial,
                                                                        int secondarySerial,
                                                                        double sameDayAs) const;
};

} // namespace sdi
