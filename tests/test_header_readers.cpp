#include <gtest/gtest.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "core/common/Errors.hpp"
#include "core/gather/FileGatherer.hpp"
#include "core/gather/HeaderReaders.hpp"
#include "TestSupport.hpp"

using namespace sdi;

namespace {

template <typename T>
void put(std::string& buf, T v) {
  char raw[sizeof(T)];
  std::memcpy(raw, &v, sizeof(T));
  buf.append(raw, sizeof(T));
}

std::string kmallDatagram(const char* type, uint32_t sec, const std::string& body) {
  const uint32_t numBytes = static_cast<uint32_t>(20 + body.size() + 4);
  std::string d;
  put<uint32_t>(d, numBytes);
  d.append(type, 4);
  put<uint8_t>(d, 1);      // version
  put<uint8_t>(d, 0);      // system id
  put<uint16_t>(d, 710);   // echo sounder id
  put<uint32_t>(d, sec);
  put<uint32_t>(d, 0);
  d += body;
  put<uint32_t>(d, numBytes);
  return d;
}

std::string kmallFile(uint32_t start, uint32_t end, const std::string& installText) {
  std::string cmn;
  put<uint16_t>(cmn, static_cast<uint16_t>(6 + installText.size()));
  put<uint16_t>(cmn, 0);
  put<uint16_t>(cmn, 0);
  return kmallDatagram("#IIP", start, cmn + installText) + kmallDatagram("#MRZ", start + 1, std::string(16, '\0')) +
         kmallDatagram("#MRZ", end, std::string(16, '\0'));
}

std::string allDatagram(uint8_t type, uint32_t date, uint32_t ms, uint16_t serial, uint16_t serial2) {
  const std::string payload(4, '\0');
  std::string d;
  put<uint32_t>(d, static_cast<uint32_t>(18 + payload.size()));
  put<uint8_t>(d, 0x02);
  put<uint8_t>(d, type);
  put<uint16_t>(d, 2040);
  put<uint32_t>(d, date);
  put<uint32_t>(d, ms);
  put<uint16_t>(d, 1);
  put<uint16_t>(d, serial);
  put<uint16_t>(d, serial2);
  d += payload;
  return d;
}

std::string records(const std::vector<std::vector<double>>& rows) {
  std::string d;
  for (const auto& r : rows) {
    for (double v : r) put<double>(d, v);
  }
  return d;
}

std::vector<double> sbetRecord(double t) {
  std::vector<double> r(17, 0.5);
  r[0] = t;
  r[1] = 0.7068;   // latitude, radians
  r[2] = -1.3362;  // longitude, radians
  r[3] = -30.0;
  return r;
}

std::vector<double> smrmsgRecord(double t) {
  std::vector<double> r(10, 0.02);
  r[0] = t;
  return r;
}

} // namespace

TEST(HeaderReaders, KmallHeader) {
  fixtures::TempDir dir;
  const std::string path = dir.file("0001_20200317_094852.kmall");
  fixtures::writeBytes(path, kmallFile(1584438532u, 1584439132u,
                                      "#IIP,OSCV:Empty,EMXV:EM710,PU_0,SN=241,IP=157.237.20.40:0xffff0000,"));

  const auto h = headers::readKmallHeader(path);
  EXPECT_EQ(h.model, "em710");
  EXPECT_EQ(h.primarySerial, 241);
  EXPECT_EQ(h.secondarySerial, 0);
  EXPECT_DOUBLE_EQ(h.startUtc, 1584438532.0);
  EXPECT_DOUBLE_EQ(h.endUtc, 1584439132.0);

  FastHeaderGatherer gatherer;
  const auto attrs = gatherer.gatherMultibeam(path);
  EXPECT_EQ(attrs["type"], "kongsberg_kmall");
  EXPECT_EQ(attrs["primary_serial"], 241);
  EXPECT_EQ(attrs["sonar_model"], "em710");
}

TEST(HeaderReaders, KmallDualHeadSerials) {
  fixtures::TempDir dir;
  const std::string path = dir.file("dual.kmall");
  fixtures::writeBytes(path, kmallFile(1584438532u, 1584438600u, "PU_0,SN=40012,PU_1,SN=40013,"));
  const auto h = headers::readKmallHeader(path);
  EXPECT_EQ(h.primarySerial, 40012);
  EXPECT_EQ(h.secondarySerial, 40013);
}

TEST(HeaderReaders, KmallGarbageIsCorrupt) {
  fixtures::TempDir dir;
  const std::string path = dir.file("junk.kmall");
  fixtures::writeBytes(path, std::string(64, 'x'));
  EXPECT_THROW(headers::readKmallHeader(path), CorruptSourceFile);
  EXPECT_THROW(headers::readKmallHeader(dir.file("missing.kmall")), CorruptSourceFile);
}

TEST(HeaderReaders, KmallOversizedInstallDatagramIsCorrupt) {
  fixtures::TempDir dir;
  const std::string path = dir.file("oversized.kmall");
  std::string install = kmallDatagram("#IIP", 1584438532u, std::string(6, '\0') + "PU_0,SN=241,");
  const uint32_t bogus = 0xFFFFFF00u;
  std::memcpy(&install[0], &bogus, sizeof(bogus));
  fixtures::writeBytes(path, kmallDatagram("#IOP", 1584438532u, std::string(8, '\0')) + install);
  EXPECT_THROW(headers::readKmallHeader(path), CorruptSourceFile);
}

TEST(HeaderReaders, AllHeader) {
  fixtures::TempDir dir;
  const std::string path = dir.file("0001_20200317_094852.all");
  // 09:48:52 is 35332000 ms into the day
  fixtures::writeBytes(path, allDatagram('I', 20200317, 35332000, 100, 101) +
                                allDatagram('D', 20200317, 35333000, 100, 0) +
                                allDatagram('D', 20200317, 35932000, 100, 0));
  const auto h = headers::readAllHeader(path);
  EXPECT_EQ(h.model, "em2040");
  EXPECT_EQ(h.primarySerial, 100);
  EXPECT_EQ(h.secondarySerial, 101);
  EXPECT_DOUBLE_EQ(h.startUtc, 1584438532.0);
  EXPECT_DOUBLE_EQ(h.endUtc, 1584439132.0);

  FastHeaderGatherer gatherer;
  EXPECT_EQ(gatherer.gatherMultibeam(path)["type"], "kongsberg_all");
}

TEST(HeaderReaders, AllEndTimeComesFromLastDatagram) {
  fixtures::TempDir dir;
  const std::string path = dir.file("0002_20200317_094852.all");
  std::string bytes = allDatagram('I', 20200317, 35332000, 100, 101);
  for (uint32_t n = 0; n < 200; ++n) bytes += allDatagram('D', 20200317, 35333000 + n * 1000, 100, 0);
  // trailing datagram without a date is skipped
  bytes += allDatagram('P', 0, 0, 100, 0);
  fixtures::writeBytes(path, bytes);

  const auto h = headers::readAllHeader(path);
  EXPECT_EQ(h.primarySerial, 100);
  EXPECT_EQ(h.secondarySerial, 101);
  EXPECT_DOUBLE_EQ(h.startUtc, 1584438532.0);
  EXPECT_DOUBLE_EQ(h.endUtc, 1584438532.0 + 200.0);
}

TEST(HeaderReaders, SbetAndSmrmsgAreToldApart) {
  fixtures::TempDir dir;
  const std::string sbet = dir.file("sbet_Mission_1.out");
  const std::string smrmsg = dir.file("smrmsg_Mission_1.out");
  const std::string text = dir.file("notes.out");
  fixtures::writeBytes(sbet, records({sbetRecord(210773.5), sbetRecord(210773.52), sbetRecord(212846.8)}));
  fixtures::writeBytes(smrmsg, records({smrmsgRecord(210774.0), smrmsgRecord(210775.0), smrmsgRecord(211000.0),
                                       smrmsgRecord(212847.0)}));
  fixtures::writeBytes(text, "this is not navigation\n");

  auto tms = headers::sbetStartEnd(sbet);
  ASSERT_TRUE(tms.has_value());
  EXPECT_DOUBLE_EQ(tms->first, 210773.5);
  EXPECT_DOUBLE_EQ(tms->second, 212846.8);
  EXPECT_FALSE(headers::isSmrmsg(sbet));

  auto err = headers::smrmsgStartEnd(smrmsg);
  ASSERT_TRUE(err.has_value());
  EXPECT_DOUBLE_EQ(err->second, 212847.0);
  EXPECT_FALSE(headers::isSbet(smrmsg));

  FastHeaderGatherer gatherer;
  EXPECT_EQ(gatherer.sniffNavigation(sbet), NavFormat::Navigation);
  EXPECT_EQ(gatherer.sniffNavigation(smrmsg), NavFormat::NavError);
  EXPECT_EQ(gatherer.sniffNavigation(text), NavFormat::Neither);
  EXPECT_EQ(gatherer.gatherNavigation(sbet)["type"], "POSPac sbet");
  EXPECT_EQ(gatherer.gatherNavError(smrmsg)["weekly_seconds_start"], 210774.0);
  EXPECT_THROW(gatherer.gatherNavigation(text), CorruptSourceFile);
}

TEST(HeaderReaders, ExportLog) {
  fixtures::TempDir dir;
  const std::string path = dir.file("export_Mission_1.txt");
  fixtures::writeBytes(path,
                      "POSPac export\n"
                      "Input SBET file: C:\\pospac\\sbet_Mission 1.out\n"
                      "Output file: D:\\export\\sbet_Mission_1.out\n"
                      "Sample rate: 50\n"
                      "Mission date: 2020-03-17\n"
                      "Datum: WGS84\n"
                      "Ellipsoid: WGS84\n");
  const auto info = headers::readExportLog(path);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->inputSbetFile, "C:\\pospac\\sbet_Mission 1.out");
  EXPECT_EQ(info->exportedSbetFile, "D:\\export\\sbet_Mission_1.out");
  EXPECT_DOUBLE_EQ(info->sampleRateHz, 50.0);
  EXPECT_EQ(info->missionDate, "2020-03-17");
  EXPECT_EQ(info->datum, "WGS84");

  const std::string readme = dir.file("readme.txt");
  fixtures::writeBytes(readme, "Notes: nothing to see\n");
  EXPECT_FALSE(headers::readExportLog(readme).has_value());
  FastHeaderGatherer gatherer;
  EXPECT_FALSE(gatherer.gatherExportLog(readme).has_value());
}

TEST(HeaderReaders, CarisSvp) {
  fixtures::TempDir dir;
  const std::string path = dir.file("casts.svp");
  fixtures::writeBytes(path,
                      "[SVP_VERSION_2]\n"
                      "casts.svp\n"
                      "Section 2020-077 09:00:00 40:30:00 -076:33:29.5\n"
                      "1.0 1500.0\n"
                      "10.0 1495.5\n"
                      "Section 2020-077 12:00 40:31:00 -076:34:00\n"
                      "2.0 1501.0\n");
  const auto casts = headers::readCarisSvp(path);
  ASSERT_EQ(casts.size(), 2u);
  EXPECT_EQ(casts[0].julianDay, "2020-077");
  EXPECT_DOUBLE_EQ(casts[0].timeUtc, 1584435600.0);
  EXPECT_DOUBLE_EQ(casts[1].timeUtc, 1584446400.0);
  EXPECT_NEAR(casts[0].latitude, 40.5, 1e-9);
  EXPECT_NEAR(casts[0].longitude, -76.558194, 1e-5);
  ASSERT_EQ(casts[0].layers.size(), 2u);
  EXPECT_DOUBLE_EQ(casts[0].layers[1].second, 1495.5);

  FastHeaderGatherer gatherer;
  const auto attrs = gatherer.gatherSvp(path);
  EXPECT_EQ(attrs["type"], "caris_svp");
  EXPECT_EQ(attrs["number_of_profiles"], 2);
  EXPECT_EQ(attrs["utm_zone"], 18);
  EXPECT_EQ(attrs["utm_hemisphere"], "N");
  EXPECT_EQ(attrs["source_epsg"], 32618);
}

TEST(HeaderReaders, SvpWithoutHeaderIsCorrupt) {
  fixtures::TempDir dir;
  const std::string path = dir.file("bad.svp");
  fixtures::writeBytes(path, "1.0 1500.0\n");
  EXPECT_THROW(headers::readCarisSvp(path), CorruptSourceFile);
}
