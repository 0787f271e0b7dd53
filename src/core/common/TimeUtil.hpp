#pragma once
#include <cstdint>
#include <string>

namespace sdi::timeutil {

constexpr double kSecondsPerWeek = 604800.0;
constexpr double kSecondsPerDay = 86400.0;
// 1980-01-06T00:00:00Z, start of GPS week 0
constexpr int64_t kGpsEpochUnix = 315964800;

int64_t nowUtc();

// Seconds into the GPS week for a UTC epoch time. Leap seconds are ignored,
// callers compare with tolerances far larger than the offset.
double weeklySeconds(double epochSeconds);

// Smallest distance between two times of week, wrapping at the week boundary.
double weeklyDistance(double a, double b);

// Calendar day index (days since 1970-01-01) of a UTC epoch time.
int64_t utcDay(double epochSeconds);

// "MM_DD_YYYY", used in synthesized container names.
std::string folderDate(double epochSeconds);

// "2020-03-17T09:48:52Z"
std::string isoUtc(double epochSeconds);

// Epoch seconds from a UTC year / day of year / time of day.
double fromYearDay(int year, int dayOfYear, int hour, int minute, double second);

// Epoch seconds from a UTC calendar date.
double fromCalendar(int year, int month, int day, int hour, int minute, double second);

} // namespace sdi::timeutil
