#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/project/Project.hpp"

namespace sdi {

// Persisted description of one converted container.
struct InstanceRecord {
  std::string key;
  std::string model;
  int         primarySerial = 0;
  int         secondarySerial = 0;
  double      dataStartUtc = 0.0;
  ProcessingStep nextStep = ProcessingStep::Orientation;
  int64_t     createdAt = 0;
  int64_t     updatedAt = 0;

  std::vector<std::string> multibeamFiles;
  std::vector<std::string> navigationFiles;
  std::vector<std::string> svpFiles;
  std::vector<double>      castTimes;
};

// Snapshot of any instance handle in persistable form.
InstanceRecord toInstanceRecord(const std::string& key, const FqprInstance& instance);

class CatalogInstance : public FqprInstance {
public:
  explicit CatalogInstance(InstanceRecord record) : record_(std::move(record)) {}

  std::vector<int> serialNumbers() const override { return {record_.primarySerial, record_.secondarySerial}; }
  std::string modelNumber() const override { return record_.model; }
  double dataStartUtc() const override { return record_.dataStartUtc; }
  std::vector<std::string> importedFiles(FileCategory category) const override;
  ProcessingStep nextRequiredStep() const override { return record_.nextStep; }
  std::vector<double> castTimes() const override { return record_.castTimes; }

  const InstanceRecord& record() const { return record_; }
  InstanceRecord& record() { return record_; }

private:
  InstanceRecord record_;
};

} // namespace sdi
