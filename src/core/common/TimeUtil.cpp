#include "TimeUtil.hpp"
#include <cmath>
#include <ctime>
#include <cstdio>

namespace sdi::timeutil {

namespace {

// days_from_civil, proleptic Gregorian
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::tm toTm(double epochSeconds) {
  std::time_t t = static_cast<std::time_t>(std::floor(epochSeconds));
  std::tm out{};
  gmtime_r(&t, &out);
  return out;
}

} // namespace

int64_t nowUtc() {
  return static_cast<int64_t>(std::time(nullptr));
}

double weeklySeconds(double epochSeconds) {
  double w = std::fmod(epochSeconds - static_cast<double>(kGpsEpochUnix), kSecondsPerWeek);
  if (w < 0) w += kSecondsPerWeek;
  return w;
}

double weeklyDistance(double a, double b) {
  double d = std::fabs(std::fmod(a - b, kSecondsPerWeek));
  return d > kSecondsPerWeek / 2 ? kSecondsPerWeek - d : d;
}

int64_t utcDay(double epochSeconds) {
  return static_cast<int64_t>(std::floor(epochSeconds / kSecondsPerDay));
}

std::string folderDate(double epochSeconds) {
  std::tm t = toTm(epochSeconds);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d_%02d_%04d", t.tm_mon + 1, t.tm_mday, t.tm_year + 1900);
  return buf;
}

std::string isoUtc(double epochSeconds) {
  std::tm t = toTm(epochSeconds);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &t);
  return buf;
}

double fromYearDay(int year, int dayOfYear, int hour, int minute, double second) {
  const int64_t days = daysFromCivil(year, 1, 1) + (dayOfYear - 1);
  return static_cast<double>(days) * kSecondsPerDay + hour * 3600.0 + minute * 60.0 + second;
}

double fromCalendar(int year, int month, int day, int hour, int minute, double second) {
  const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  return static_cast<double>(days) * kSecondsPerDay + hour * 3600.0 + minute * 60.0 + second;
}

} // namespace sdi::timeutil
