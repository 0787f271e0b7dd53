#include "FileGatherer.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sys/stat.h>

#include "core/common/Errors.hpp"
#include "core/common/Paths.hpp"
#include "core/common/TimeUtil.hpp"
#include "core/gather/HeaderReaders.hpp"

using nlohmann::json;

namespace sdi {

namespace {

// WGS84 / UTM zone N = 326zz, S = 327zz
void addUtmInfo(json& j, double latitude, double longitude) {
  int zone = static_cast<int>(std::floor((longitude + 180.0) / 6.0)) + 1;
  zone = std::min(std::max(zone, 1), 60);
  const bool north = latitude >= 0.0;
  j["utm_zone"] = zone;
  j["utm_hemisphere"] = north ? "N" : "S";
  j["source_epsg"] = (north ? 32600 : 32700) + zone;
}

} // namespace

json gatherBasicFileInfo(const std::string& path) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (!fs::exists(path, ec)) throw CorruptSourceFile(path + " does not exist");
  if (!fs::is_regular_file(path, ec)) throw CorruptSourceFile(path + " is not a file");
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) throw CorruptSourceFile("Cannot stat " + path);
  const double sizeKB = std::round(static_cast<double>(st.st_size) / 1024.0 * 1000.0) / 1000.0;
  return json{
    {"path", paths::normalize(path)},
    {"last_modified_utc", static_cast<int64_t>(st.st_mtime)},
    {"created_utc", static_cast<int64_t>(st.st_ctime)},
    {"size_kb", sizeKB},
    {"time_added", timeutil::nowUtc()}
  };
}

json FastHeaderGatherer::gatherMultibeam(const std::string& path) const {
  json info = gatherBasicFileInfo(path);
  const std::string ext = paths::extension(path);
  headers::MultibeamHeader h;
  if (ext == ".all") {
    info["type"] = "kongsberg_all";
    h = headers::readAllHeader(path);
  } else if (ext == ".kmall") {
    info["type"] = "kongsberg_kmall";
    h = headers::readKmallHeader(path);
  } else {
    throw CorruptSourceFile("File (" + path + ") is not a valid multibeam file");
  }
  info["data_start_utc"] = h.startUtc;
  info["data_end_utc"] = h.endUtc;
  info["primary_serial"] = h.primarySerial;
  info["secondary_serial"] = h.secondarySerial;
  info["sonar_model"] = h.model;
  return info;
}

json FastHeaderGatherer::gatherNavigation(const std::string& path) const {
  json info = gatherBasicFileInfo(path);
  auto tms = headers::sbetStartEnd(path);
  if (!tms) throw CorruptSourceFile("File (" + path + ") is not a valid postprocessed navigation file");
  info["type"] = "POSPac sbet";
  info["weekly_seconds_start"] = tms->first;
  info["weekly_seconds_end"] = tms->second;
  return info;
}

json FastHeaderGatherer::gatherNavError(const std::string& path) const {
  json info = gatherBasicFileInfo(path);
  auto tms = headers::smrmsgStartEnd(path);
  if (!tms) throw CorruptSourceFile("File (" + path + ") is not a valid postprocessed error file");
  info["type"] = "POSPac smrmsg";
  info["weekly_seconds_start"] = tms->first;
  info["weekly_seconds_end"] = tms->second;
  return info;
}

std::optional<json> FastHeaderGatherer::gatherExportLog(const std::string& path) const {
  json info = gatherBasicFileInfo(path);
  auto log = headers::readExportLog(path);
  if (!log) return std::nullopt;
  info["type"] = "sbet_export_log";
  info["input_sbet_file"] = log->inputSbetFile;
  info["exported_sbet_file"] = log->exportedSbetFile;
  info["sample_rate_hz"] = log->sampleRateHz;
  info["mission_date"] = log->missionDate;
  info["datum"] = log->datum;
  info["ellipsoid"] = log->ellipsoid;
  return info;
}

json FastHeaderGatherer::gatherSvp(const std::string& path) const {
  json info = gatherBasicFileInfo(path);
  const auto casts = headers::readCarisSvp(path);
  json profiles = json::array(), layers = json::array(), days = json::array(), times = json::array(),
       castTimes = json::array(), lats = json::array(), lons = json::array();
  for (const auto& c : casts) {
    profiles.push_back(c.layers);
    layers.push_back(static_cast<int>(c.layers.size()));
    days.push_back(c.julianDay);
    times.push_back(timeutil::isoUtc(c.timeUtc));
    castTimes.push_back(c.timeUtc);
    lats.push_back(c.latitude);
    lons.push_back(c.longitude);
  }
  info["type"] = "caris_svp";
  info["profiles"] = profiles;
  info["number_of_profiles"] = static_cast<int>(casts.size());
  info["number_of_layers"] = layers;
  info["julian_day"] = days;
  info["time_utc"] = times;
  info["cast_times"] = castTimes;
  info["latitude"] = lats;
  info["longitude"] = lons;
  addUtmInfo(info, casts.front().latitude, casts.front().longitude);
  return info;
}

NavFormat FastHeaderGatherer::sniffNavigation(const std::string& path) const {
  // people mix up the extensions, so check content both ways; trust the
  // extension only to decide which check runs first
  if (paths::extension(path) == ".smrmsg") {
    if (headers::isSmrmsg(path)) return NavFormat::NavError;
    if (headers::isSbet(path)) return NavFormat::Navigation;
    return NavFormat::Neither;
  }
  if (headers::isSbet(path)) return NavFormat::Navigation;
  if (headers::isSmrmsg(path)) return NavFormat::NavError;
  return NavFormat::Neither;
}

} // namespace sdi
