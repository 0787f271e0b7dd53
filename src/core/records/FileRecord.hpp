#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdi {

enum class FileCategory { Multibeam, Navigation, NavError, NavExportLog, Svp };

const char* toString(FileCategory c);

// Columns every ingested file carries. Times are UTC epoch seconds.
struct FileRecord {
  std::string path;
  std::string fileName;
  std::string type;
  double      sizeKB = 0.0;
  int64_t     lastModifiedUtc = 0;
  int64_t     createdUtc = 0;
  int64_t     timeAdded = 0;
  uint64_t    uniqueId = 0;
};

struct MultibeamRecord : FileRecord {
  double      dataStartUtc = 0.0;
  double      dataEndUtc = 0.0;
  int         primarySerial = 0;
  int         secondarySerial = 0;  // nonzero only for dual head systems
  std::string sonarModel;
};

// SBET, time in GPS seconds of week
struct NavigationRecord : FileRecord {
  double weeklySecondsStart = 0.0;
  double weeklySecondsEnd = 0.0;
};

// SMRMSG
struct NavErrorRecord : FileRecord {
  double weeklySecondsStart = 0.0;
  double weeklySecondsEnd = 0.0;
};

struct NavExportLogRecord : FileRecord {
  std::string missionDate;
  std::string datum;
  std::string ellipsoid;
  std::string inputSbetFileName;
  std::string exportedSbetFileName;
  double      sampleRateHz = 0.0;
};

using SvpLayer = std::pair<double, double>;  // depth (m), sound speed (m/s)

struct SvpRecord : FileRecord {
  std::vector<std::vector<SvpLayer>> profiles;
  int                      numberOfProfiles = 0;
  std::vector<int>         numberOfLayers;
  std::vector<std::string> julianDay;   // "2020-077"
  std::vector<std::string> timeUtc;     // ISO 8601
  std::vector<double>      castTimes;   // epoch seconds, same order as timeUtc
  std::vector<double>      latitude;
  std::vector<double>      longitude;
  int                      sourceEpsg = 0;
  int                      utmZone = 0;
  std::string              utmHemisphere;
};

// Store one attribute into a row. Returns false for keys the row does not
// know; throws InvalidInput when a known key carries the wrong JSON type.
bool assignAttribute(MultibeamRecord& r, const std::string& key, const nlohmann::json& v);
bool assignAttribute(NavigationRecord& r, const std::string& key, const nlohmann::json& v);
bool assignAttribute(NavErrorRecord& r, const std::string& key, const nlohmann::json& v);
bool assignAttribute(NavExportLogRecord& r, const std::string& key, const nlohmann::json& v);
bool assignAttribute(SvpRecord& r, const std::string& key, const nlohmann::json& v);

nlohmann::json toJson(const MultibeamRecord& r);
nlohmann::json toJson(const NavigationRecord& r);
nlohmann::json toJson(const NavErrorRecord& r);
nlohmann::json toJson(const NavExportLogRecord& r);
nlohmann::json toJson(const SvpRecord& r);

} // namespace sdi
