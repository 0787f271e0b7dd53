#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sdi {

enum class NavFormat { Navigation, NavError, Neither };

/*
  Produces the flat attribute record a store ingests ("path", "type", the
  bookkeeping columns and the category columns). Implementations read header
  level metadata only and throw CorruptSourceFile when the file is not a valid
  instance of its claimed format.
*/
class FileGatherer {
public:
  virtual ~FileGatherer() = default;

  virtual nlohmann::json gatherMultibeam(const std::string& path) const = 0;
  virtual nlohmann::json gatherNavigation(const std::string& path) const = 0;
  virtual nlohmann::json gatherNavError(const std::string& path) const = 0;
  // nullopt when the text file is not an export log
  virtual std::optional<nlohmann::json> gatherExportLog(const std::string& path) const = 0;
  virtual nlohmann::json gatherSvp(const std::string& path) const = 0;

  // SBET and SMRMSG share extensions; decide from content.
  virtual NavFormat sniffNavigation(const std::string& path) const = 0;
};

// size, times and ingestion time of any regular file
nlohmann::json gatherBasicFileInfo(const std::string& path);

class FastHeaderGatherer : public FileGatherer {
public:
  nlohmann::json gatherMultibeam(const std::string& path) const override;
  nlohmann::json gatherNavigation(const std::string& path) const override;
  nlohmann::json gatherNavError(const std::string& path) const override;
  std::optional<nlohmann::json> gatherExportLog(const std::string& path) const override;
  nlohmann::json gatherSvp(const std::string& path) const override;
  NavFormat sniffNavigation(const std::string& path) const override;
};

} // namespace sdi
