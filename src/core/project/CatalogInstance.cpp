#include "CatalogInstance.hpp"

namespace sdi {

std::vector<std::string> CatalogInstance::importedFiles(FileCategory category) const {
  switch (category) {
    case FileCategory::Multibeam:  return record_.multibeamFiles;
    case FileCategory::Navigation: return record_.navigationFiles;
    case FileCategory::Svp:        return record_.svpFiles;
    default:                       return {};
  }
}

InstanceRecord toInstanceRecord(const std::string& key, const FqprInstance& instance) {
  if (auto* catalog = dynamic_cast<const CatalogInstance*>(&instance)) {
    InstanceRecord r = catalog->record();
    r.key = key;
    return r;
  }
  InstanceRecord r;
  r.key = key;
  const auto serials = instance.serialNumbers();
  r.primarySerial = serials.empty() ? 0 : serials[0];
  r.secondarySerial = serials.size() > 1 ? serials[1] : 0;
  r.model = instance.modelNumber();
  r.dataStartUtc = instance.dataStartUtc();
  r.nextStep = instance.nextRequiredStep();
  r.multibeamFiles = instance.importedFiles(FileCategory::Multibeam);
  r.navigationFiles = instance.importedFiles(FileCategory::Navigation);
  r.svpFiles = instance.importedFiles(FileCategory::Svp);
  r.castTimes = instance.castTimes();
  return r;
}

} // namespace sdi
