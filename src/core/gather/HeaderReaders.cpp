#include "HeaderReaders.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

#include "core/common/Errors.hpp"
#include "core/common/TimeUtil.hpp"

namespace sdi::headers {

namespace {

constexpr std::size_t kSbetRecordDoubles = 17;
constexpr std::size_t kSmrmsgRecordDoubles = 10;
constexpr double kPi = 3.14159265358979323846;

// kmall datagram header: numBytesDgm, dgmType[4], dgmVersion, systemID,
// echoSounderID, time_sec, time_nanosec
struct KmallDgmHeader {
  uint32_t numBytes = 0;
  char     type[4] = {0, 0, 0, 0};
  uint8_t  version = 0;
  uint8_t  systemId = 0;
  uint16_t echoSounderId = 0;
  uint32_t timeSec = 0;
  uint32_t timeNanoSec = 0;
};
constexpr std::size_t kKmallHeaderSize = 20;
// install text is a few kB in practice
constexpr std::size_t kMaxInstallText = 64 * 1024;

// .all datagram header including the leading length field
constexpr std::size_t kAllHeaderSize = 22;
constexpr uint8_t kAllStx = 0x02;
constexpr uint8_t kAllInstallStart = 0x49;  // 'I'
// installation parameters are written at the start of a line
constexpr std::size_t kAllLeadingDatagrams = 64;
constexpr std::uint64_t kAllTailBytes = 256 * 1024;

// numBytes, STX, type, model, YYYYMMDD, ms of day, counter, serial, then the
// secondary serial for installation datagrams
struct AllDgmHeader {
  uint32_t numBytes = 0;
  uint8_t  stx = 0;
  uint8_t  type = 0;
  uint16_t model = 0;
  uint32_t date = 0;
  uint32_t ms = 0;
  uint16_t serial = 0;
  uint16_t serial2 = 0;
};

template <typename T>
T readLE(const char* p) {
  T v;
  std::memcpy(&v, p, sizeof(T));
  return v;
}

std::ifstream openBinary(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw CorruptSourceFile("Cannot open " + path);
  return in;
}

std::uint64_t fileSize(std::ifstream& in) {
  in.seekg(0, std::ios::end);
  const auto size = static_cast<std::uint64_t>(in.tellg());
  in.seekg(0, std::ios::beg);
  return size;
}

bool readAt(std::ifstream& in, std::uint64_t offset, char* buf, std::size_t n) {
  in.clear();
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  in.read(buf, static_cast<std::streamsize>(n));
  return static_cast<std::size_t>(in.gcount()) == n;
}

KmallDgmHeader parseKmallHeader(const char* buf) {
  KmallDgmHeader h;
  h.numBytes = readLE<uint32_t>(buf);
  std::memcpy(h.type, buf + 4, 4);
  h.version = static_cast<uint8_t>(buf[8]);
  h.systemId = static_cast<uint8_t>(buf[9]);
  h.echoSounderId = readLE<uint16_t>(buf + 10);
  h.timeSec = readLE<uint32_t>(buf + 12);
  h.timeNanoSec = readLE<uint32_t>(buf + 16);
  return h;
}

AllDgmHeader parseAllHeader(const char* buf) {
  AllDgmHeader h;
  h.numBytes = readLE<uint32_t>(buf);
  h.stx = static_cast<uint8_t>(buf[4]);
  h.type = static_cast<uint8_t>(buf[5]);
  h.model = readLE<uint16_t>(buf + 6);
  h.date = readLE<uint32_t>(buf + 8);
  h.ms = readLE<uint32_t>(buf + 12);
  h.serial = readLE<uint16_t>(buf + 18);
  h.serial2 = readLE<uint16_t>(buf + 20);
  return h;
}

double allTime(const AllDgmHeader& h) {
  return timeutil::fromCalendar(static_cast<int>(h.date / 10000), static_cast<int>(h.date / 100 % 100),
                                static_cast<int>(h.date % 100), 0, 0, h.ms / 1000.0);
}

double kmallTime(const KmallDgmHeader& h) {
  return static_cast<double>(h.timeSec) + static_cast<double>(h.timeNanoSec) * 1e-9;
}

// digits following "SN=" after the given section marker, 0 if absent
int serialAfter(const std::string& text, const std::string& section) {
  auto pos = text.find(section);
  if (pos == std::string::npos) return 0;
  pos = text.find("SN=", pos);
  if (pos == std::string::npos) return 0;
  pos += 3;
  int value = 0;
  bool any = false;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    value = value * 10 + (text[pos] - '0');
    any = true;
    ++pos;
  }
  return any ? value : 0;
}

std::optional<std::pair<double, double>> recordStartEnd(const std::string& path, std::size_t recordDoubles) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  const std::size_t recordSize = recordDoubles * sizeof(double);
  const auto size = fileSize(in);
  if (size < recordSize || size % recordSize != 0) return std::nullopt;
  double first = 0.0, last = 0.0;
  if (!readAt(in, 0, reinterpret_cast<char*>(&first), sizeof(double))) return std::nullopt;
  if (!readAt(in, size - recordSize, reinterpret_cast<char*>(&last), sizeof(double))) return std::nullopt;
  return std::make_pair(first, last);
}

bool plausibleWeekTime(double t) {
  return std::isfinite(t) && t >= 0.0 && t <= timeutil::kSecondsPerWeek;
}

bool plausibleSbetRecord(const double* r) {
  return plausibleWeekTime(r[0]) && std::fabs(r[1]) <= kPi / 2 && std::fabs(r[2]) <= kPi &&
         std::isfinite(r[3]) && r[3] > -1.0e4 && r[3] < 1.0e5;
}

bool plausibleSmrmsgRecord(const double* r) {
  if (!plausibleWeekTime(r[0])) return false;
  for (std::size_t i = 1; i < kSmrmsgRecordDoubles; ++i) {
    if (!std::isfinite(r[i]) || r[i] < 0.0 || r[i] > 1.0e5) return false;
  }
  return true;
}

// first two records must pass `check` and time must not go backwards
template <typename Check>
bool sniffRecords(const std::string& path, std::size_t recordDoubles, Check check) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  const std::size_t recordSize = recordDoubles * sizeof(double);
  const auto size = fileSize(in);
  if (size < recordSize || size % recordSize != 0) return false;
  std::vector<double> recs(recordDoubles * 2, 0.0);
  const std::size_t count = size >= 2 * recordSize ? 2 : 1;
  if (!readAt(in, 0, reinterpret_cast<char*>(recs.data()), count * recordSize)) return false;
  if (!check(recs.data())) return false;
  if (count == 2) {
    const double* second = recs.data() + recordDoubles;
    if (!check(second) || second[0] < recs[0]) return false;
  }
  return true;
}

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return std::string();
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// "-076:33:29.5" -> decimal degrees
double parseDms(const std::string& s) {
  std::string body = trim(s);
  const bool negative = !body.empty() && body[0] == '-';
  if (!body.empty() && (body[0] == '-' || body[0] == '+')) body = body.substr(1);
  double parts[3] = {0.0, 0.0, 0.0};
  std::stringstream ss(body);
  std::string tok;
  int i = 0;
  while (i < 3 && std::getline(ss, tok, ':')) parts[i++] = std::stod(tok);
  const double v = parts[0] + parts[1] / 60.0 + parts[2] / 3600.0;
  return negative ? -v : v;
}

} // namespace

MultibeamHeader readKmallHeader(const std::string& path) {
  auto in = openBinary(path);
  const auto size = fileSize(in);
  char buf[kKmallHeaderSize];
  if (size < kKmallHeaderSize || !readAt(in, 0, buf, kKmallHeaderSize)) {
    throw CorruptSourceFile("File (" + path + ") is too small to be a kmall file");
  }
  KmallDgmHeader first = parseKmallHeader(buf);
  if (first.type[0] != '#' || first.numBytes < kKmallHeaderSize || first.numBytes > size) {
    throw CorruptSourceFile("File (" + path + ") does not start with a kmall datagram");
  }

  MultibeamHeader out;
  out.startUtc = kmallTime(first);
  out.model = "em" + std::to_string(first.echoSounderId);

  // the installation datagram is written first, allow a few before it
  std::uint64_t offset = 0;
  KmallDgmHeader h = first;
  std::string installText;
  for (int i = 0; i < 8; ++i) {
    if (h.numBytes > size - offset) {
      throw CorruptSourceFile("File (" + path + ") has a " + std::string(h.type, 4) +
                              " datagram running past the end of the file");
    }
    if (std::memcmp(h.type, "#IIP", 4) == 0) {
      // common part: numBytesCmnPart, info, status, then text up to the
      // trailing length copy
      const std::size_t bodyStart = kKmallHeaderSize + 6;
      if (h.numBytes > bodyStart + 4) {
        installText.resize(std::min<std::size_t>(h.numBytes - bodyStart - 4, kMaxInstallText));
        if (!readAt(in, offset + bodyStart, &installText[0], installText.size())) installText.clear();
      }
      break;
    }
    offset += h.numBytes;
    if (offset + kKmallHeaderSize > size || !readAt(in, offset, buf, kKmallHeaderSize)) break;
    h = parseKmallHeader(buf);
    if (h.type[0] != '#' || h.numBytes < kKmallHeaderSize) break;
  }
  if (installText.empty()) {
    throw CorruptSourceFile("File (" + path + ") has no #IIP installation datagram");
  }
  out.primarySerial = serialAfter(installText, "PU_0");
  if (out.primarySerial == 0) out.primarySerial = serialAfter(installText, "");
  out.secondarySerial = serialAfter(installText, "PU_1");
  if (out.primarySerial == 0) {
    throw CorruptSourceFile("File (" + path + ") installation text has no serial number");
  }

  // every datagram ends with a copy of its length
  uint32_t lastLen = 0;
  if (!readAt(in, size - 4, reinterpret_cast<char*>(&lastLen), 4) || lastLen < kKmallHeaderSize || lastLen > size ||
      !readAt(in, size - lastLen, buf, kKmallHeaderSize)) {
    throw CorruptSourceFile("File (" + path + ") does not end on a complete kmall datagram");
  }
  const KmallDgmHeader last = parseKmallHeader(buf);
  if (last.type[0] != '#') {
    throw CorruptSourceFile("File (" + path + ") does not end on a complete kmall datagram");
  }
  out.endUtc = kmallTime(last);
  return out;
}

MultibeamHeader readAllHeader(const std::string& path) {
  auto in = openBinary(path);
  const auto size = fileSize(in);
  MultibeamHeader out;
  bool haveFirst = false;
  bool haveInstall = false;
  int firstSerial = 0;
  std::uint64_t offset = 0;
  char buf[kAllHeaderSize];

  // start time, model and serials come from the leading datagrams
  for (std::size_t n = 0; n < kAllLeadingDatagrams && !(haveFirst && haveInstall); ++n) {
    if (offset + kAllHeaderSize > size || !readAt(in, offset, buf, kAllHeaderSize)) break;
    const AllDgmHeader h = parseAllHeader(buf);
    if (h.stx != kAllStx || h.numBytes < kAllHeaderSize - 4) {
      if (!haveFirst) throw CorruptSourceFile("File (" + path + ") does not start with a .all datagram");
      break;
    }
    if (h.date != 0 && !haveFirst) {
      out.startUtc = allTime(h);
      out.model = "em" + std::to_string(h.model);
      firstSerial = h.serial;
      haveFirst = true;
    }
    if (h.type == kAllInstallStart && !haveInstall) {
      out.primarySerial = h.serial;
      out.secondarySerial = h.serial2;
      haveInstall = true;
    }
    offset += 4 + static_cast<std::uint64_t>(h.numBytes);
  }
  if (!haveFirst) throw CorruptSourceFile("File (" + path + ") contains no dated .all datagrams");
  if (!haveInstall) out.primarySerial = firstSerial;

  // end time: follow the length chain back from the end of the file
  const std::size_t tailLen = static_cast<std::size_t>(std::min<std::uint64_t>(size, kAllTailBytes));
  std::vector<char> tail(tailLen);
  if (!readAt(in, size - tailLen, tail.data(), tailLen)) {
    throw CorruptSourceFile("File (" + path + ") could not be read to the end");
  }
  out.endUtc = out.startUtc;
  std::size_t chainEnd = tailLen;
  for (std::size_t i = tailLen >= kAllHeaderSize ? tailLen - kAllHeaderSize + 1 : 0; i-- > 0;) {
    const AllDgmHeader h = parseAllHeader(tail.data() + i);
    if (h.stx != kAllStx || h.numBytes < kAllHeaderSize - 4 || i + 4 + h.numBytes != chainEnd) continue;
    if (h.date / 10000 >= 1980) {
      out.endUtc = allTime(h);
      break;
    }
    chainEnd = i;  // undated datagram, keep walking back
  }
  return out;
}

std::optional<std::pair<double, double>> sbetStartEnd(const std::string& path) {
  if (!isSbet(path)) return std::nullopt;
  return recordStartEnd(path, kSbetRecordDoubles);
}

bool isSbet(const std::string& path) {
  return sniffRecords(path, kSbetRecordDoubles, plausibleSbetRecord);
}

std::optional<std::pair<double, double>> smrmsgStartEnd(const std::string& path) {
  if (!isSmrmsg(path)) return std::nullopt;
  return recordStartEnd(path, kSmrmsgRecordDoubles);
}

bool isSmrmsg(const std::string& path) {
  return sniffRecords(path, kSmrmsgRecordDoubles, plausibleSmrmsgRecord);
}

std::optional<ExportLogInfo> readExportLog(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw CorruptSourceFile("Cannot open " + path);
  ExportLogInfo info;
  std::string line;
  int lines = 0;
  // export logs are short, stop early on anything large
  while (lines++ < 500 && std::getline(in, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    const std::string key = lower(trim(line.substr(0, colon)));
    const std::string value = trim(line.substr(colon + 1));
    if (value.empty()) continue;
    if (key.rfind("input", 0) == 0 && key.find("file") != std::string::npos) {
      info.inputSbetFile = value;
    } else if ((key.rfind("output", 0) == 0 || key.rfind("export", 0) == 0) && key.find("file") != std::string::npos) {
      info.exportedSbetFile = value;
    } else if (key.find("sample rate") != std::string::npos || key.find("sampling rate") != std::string::npos) {
      try {
        info.sampleRateHz = std::stod(value);
      } catch (const std::exception&) {
        throw CorruptSourceFile("File (" + path + ") has an unreadable sample rate: " + value);
      }
    } else if (key.find("mission date") != std::string::npos) {
      info.missionDate = value;
    } else if (key == "datum") {
      info.datum = value;
    } else if (key == "ellipsoid") {
      info.ellipsoid = value;
    }
  }
  if (info.inputSbetFile.empty() && info.exportedSbetFile.empty()) return std::nullopt;
  return info;
}

std::vector<SvpCast> readCarisSvp(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw CorruptSourceFile("Cannot open " + path);
  std::string line;
  if (!std::getline(in, line) || trim(line).rfind("[SVP_VERSION", 0) != 0) {
    throw CorruptSourceFile("File (" + path + ") is not a Caris svp file, missing [SVP_VERSION_x] header");
  }
  std::getline(in, line);  // name of the file as written

  std::vector<SvpCast> casts;
  while (std::getline(in, line)) {
    const std::string t = trim(line);
    if (t.empty()) continue;
    std::istringstream ss(t);
    if (t.rfind("Section", 0) == 0) {
      std::string word, day, clock, lat, lon;
      ss >> word >> day >> clock >> lat >> lon;
      int year = 0, doy = 0, hh = 0, mm = 0;
      double sec = 0.0;
      if (std::sscanf(day.c_str(), "%d-%d", &year, &doy) != 2 ||
          std::sscanf(clock.c_str(), "%d:%d:%lf", &hh, &mm, &sec) < 2 || lat.empty() || lon.empty()) {
        throw CorruptSourceFile("File (" + path + ") has an unreadable section header: " + t);
      }
      SvpCast cast;
      cast.julianDay = day;
      cast.timeUtc = timeutil::fromYearDay(year, doy, hh, mm, sec);
      try {
        cast.latitude = parseDms(lat);
        cast.longitude = parseDms(lon);
      } catch (const std::exception&) {
        throw CorruptSourceFile("File (" + path + ") has an unreadable position: " + t);
      }
      casts.push_back(cast);
      continue;
    }
    double depth = 0.0, speed = 0.0;
    if (!(ss >> depth >> speed)) {
      throw CorruptSourceFile("File (" + path + ") has an unreadable layer: " + t);
    }
    if (casts.empty()) {
      throw CorruptSourceFile("File (" + path + ") has layers before any Section header");
    }
    casts.back().layers.emplace_back(depth, speed);
  }
  if (casts.empty()) throw CorruptSourceFile("File (" + path + ") contains no casts");
  return casts;
}

} // namespace sdi::headers
