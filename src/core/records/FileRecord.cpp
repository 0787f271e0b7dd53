#include "FileRecord.hpp"
#include "core/common/Errors.hpp"

using nlohmann::json;

namespace sdi {

const char* toString(FileCategory c) {
  switch (c) {
    case FileCategory::Multibeam:    return "multibeam";
    case FileCategory::Navigation:   return "navigation";
    case FileCategory::NavError:     return "naverror";
    case FileCategory::NavExportLog: return "navlog";
    case FileCategory::Svp:          return "svp";
  }
  return "unknown";
}

namespace {

template <typename T>
T as(const std::string& key, const json& v) {
  try {
    return v.get<T>();
  } catch (const json::exception& e) {
    throw InvalidInput("attribute '" + key + "' has the wrong type: " + e.what());
  }
}

// path and file_name are owned by the store, not copied from the attributes
bool assignCommon(FileRecord& r, const std::string& key, const json& v) {
  if (key == "path" || key == "file_name") return true;
  if (key == "type")              { r.type = as<std::string>(key, v); return true; }
  if (key == "size_kb")           { r.sizeKB = as<double>(key, v); return true; }
  if (key == "last_modified_utc") { r.lastModifiedUtc = as<int64_t>(key, v); return true; }
  if (key == "created_utc")       { r.createdUtc = as<int64_t>(key, v); return true; }
  if (key == "time_added")        { r.timeAdded = as<int64_t>(key, v); return true; }
  if (key == "unique_id")         { r.uniqueId = as<uint64_t>(key, v); return true; }
  return false;
}

json commonJson(const FileRecord& r) {
  return json{
    {"path", r.path},
    {"file_name", r.fileName},
    {"type", r.type},
    {"size_kb", r.sizeKB},
    {"last_modified_utc", r.lastModifiedUtc},
    {"created_utc", r.createdUtc},
    {"time_added", r.timeAdded},
    {"unique_id", r.uniqueId}
  };
}

template <typename Row>
bool assignWeekly(Row& r, const std::string& key, const json& v) {
  if (key == "weekly_seconds_start") { r.weeklySecondsStart = as<double>(key, v); return true; }
  if (key == "weekly_seconds_end")   { r.weeklySecondsEnd = as<double>(key, v); return true; }
  return false;
}

} // namespace

bool assignAttribute(MultibeamRecord& r, const std::string& key, const json& v) {
  if (assignCommon(r, key, v)) return true;
  if (key == "data_start_utc")   { r.dataStartUtc = as<double>(key, v); return true; }
  if (key == "data_end_utc")     { r.dataEndUtc = as<double>(key, v); return true; }
  if (key == "primary_serial")   { r.primarySerial = as<int>(key, v); return true; }
  if (key == "secondary_serial") { r.secondarySerial = as<int>(key, v); return true; }
  if (key == "sonar_model")      { r.sonarModel = as<std::string>(key, v); return true; }
  return false;
}

bool assignAttribute(NavigationRecord& r, const std::string& key, const json& v) {
  return assignCommon(r, key, v) || assignWeekly(r, key, v);
}

bool assignAttribute(NavErrorRecord& r, const std::string& key, const json& v) {
  return assignCommon(r, key, v) || assignWeekly(r, key, v);
}

bool assignAttribute(NavExportLogRecord& r, const std::string& key, const json& v) {
  if (assignCommon(r, key, v)) return true;
  if (key == "mission_date")       { r.missionDate = as<std::string>(key, v); return true; }
  if (key == "datum")              { r.datum = as<std::string>(key, v); return true; }
  if (key == "ellipsoid")          { r.ellipsoid = as<std::string>(key, v); return true; }
  if (key == "input_sbet_file")    { r.inputSbetFileName = as<std::string>(key, v); return true; }
  if (key == "exported_sbet_file") { r.exportedSbetFileName = as<std::string>(key, v); return true; }
  if (key == "sample_rate_hz")     { r.sampleRateHz = as<double>(key, v); return true; }
  return false;
}

bool assignAttribute(SvpRecord& r, const std::string& key, const json& v) {
  if (assignCommon(r, key, v)) return true;
  if (key == "profiles")           { r.profiles = as<std::vector<std::vector<SvpLayer>>>(key, v); return true; }
  if (key == "number_of_profiles") { r.numberOfProfiles = as<int>(key, v); return true; }
  if (key == "number_of_layers")   { r.numberOfLayers = as<std::vector<int>>(key, v); return true; }
  if (key == "julian_day")         { r.julianDay = as<std::vector<std::string>>(key, v); return true; }
  if (key == "time_utc")           { r.timeUtc = as<std::vector<std::string>>(key, v); return true; }
  if (key == "cast_times")         { r.castTimes = as<std::vector<double>>(key, v); return true; }
  if (key == "latitude")           { r.latitude = as<std::vector<double>>(key, v); return true; }
  if (key == "longitude")          { r.longitude = as<std::vector<double>>(key, v); return true; }
  if (key == "source_epsg")        { r.sourceEpsg = as<int>(key, v); return true; }
  if (key == "utm_zone")           { r.utmZone = as<int>(key, v); return true; }
  if (key == "utm_hemisphere")     { r.utmHemisphere = as<std::string>(key, v); return true; }
  return false;
}

json toJson(const MultibeamRecord& r) {
  json j = commonJson(r);
  j["data_start_utc"] = r.dataStartUtc;
  j["data_end_utc"] = r.dataEndUtc;
  j["primary_serial"] = r.primarySerial;
  j["secondary_serial"] = r.secondarySerial;
  j["sonar_model"] = r.sonarModel;
  return j;
}

json toJson(const NavigationRecord& r) {
  json j = commonJson(r);
  j["weekly_seconds_start"] = r.weeklySecondsStart;
  j["weekly_seconds_end"] = r.weeklySecondsEnd;
  return j;
}

json toJson(const NavErrorRecord& r) {
  json j = commonJson(r);
  j["weekly_seconds_start"] = r.weeklySecondsStart;
  j["weekly_seconds_end"] = r.weeklySecondsEnd;
  return j;
}

json toJson(const NavExportLogRecord& r) {
  json j = commonJson(r);
  j["mission_date"] = r.missionDate;
  j["datum"] = r.datum;
  j["ellipsoid"] = r.ellipsoid;
  j["input_sbet_file"] = r.inputSbetFileName;
  j["exported_sbet_file"] = r.exportedSbetFileName;
  j["sample_rate_hz"] = r.sampleRateHz;
  return j;
}

json toJson(const SvpRecord& r) {
  json j = commonJson(r);
  j["number_of_profiles"] = r.numberOfProfiles;
  j["number_of_layers"] = r.numberOfLayers;
  j["julian_day"] = r.julianDay;
  j["time_utc"] = r.timeUtc;
  j["cast_times"] = r.castTimes;
  j["latitude"] = r.latitude;
  j["longitude"] = r.longitude;
  j["source_epsg"] = r.sourceEpsg;
  j["utm_zone"] = r.utmZone;
  j["utm_hemisphere"] = r.utmHemisphere;
  return j;
}

} // namespace sdi
