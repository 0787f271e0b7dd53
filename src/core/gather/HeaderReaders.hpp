#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/records/FileRecord.hpp"

/*
  Header level readers for the supported raw formats. None of them decode the
  payload; they touch the first and last records (or datagram headers) only.
  Failures on a file that claims to be of the format throw CorruptSourceFile.
*/
namespace sdi::headers {

struct MultibeamHeader {
  double      startUtc = 0.0;
  double      endUtc = 0.0;
  int         primarySerial = 0;
  int         secondarySerial = 0;
  std::string model;          // "em710"
};

// Kongsberg .kmall. Serials come from the #IIP install text, "SN=" of the
// PU_0 section (primary) and PU_1 section (secondary, dual head).
MultibeamHeader readKmallHeader(const std::string& path);

// Kongsberg .all. Serials come from the installation parameters datagram.
MultibeamHeader readAllHeader(const std::string& path);

// POSPac SBET, 17 doubles per record. First and last record times in GPS
// seconds of week, nullopt when the file is not an SBET.
std::optional<std::pair<double, double>> sbetStartEnd(const std::string& path);
bool isSbet(const std::string& path);

// POSPac SMRMSG, 10 doubles per record (time and standard deviations).
std::optional<std::pair<double, double>> smrmsgStartEnd(const std::string& path);
bool isSmrmsg(const std::string& path);

struct ExportLogInfo {
  std::string inputSbetFile;
  std::string exportedSbetFile;
  double      sampleRateHz = 0.0;
  std::string missionDate;
  std::string datum;
  std::string ellipsoid;
};

// POSPac export log, nullopt when the text does not describe an export.
std::optional<ExportLogInfo> readExportLog(const std::string& path);

struct SvpCast {
  std::string           julianDay;  // "2020-077"
  double                timeUtc = 0.0;
  double                latitude = 0.0;
  double                longitude = 0.0;
  std::vector<SvpLayer> layers;
};

// Caris .svp text file, one SvpCast per "Section" header.
std::vector<SvpCast> readCarisSvp(const std::string& path);

} // namespace sdi::headers
