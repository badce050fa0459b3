#pragma once

#include <chrono>
#include <cstdint>

namespace newsret {

// Utilities for working with trading days and local wall-clock time.
//
// Convention:
//   A trading day is an integer of the form YYYYMMDD stored in a uint32_t
//   (0 means "no day"). Instants are std::chrono sys_time values in
//   milliseconds; wall-clock readings in a particular zone are local_time
//   values.

using TimePointMs = std::chrono::sys_time<std::chrono::milliseconds>;
using LocalTimeMs = std::chrono::local_time<std::chrono::milliseconds>;
using LocalMinute = std::chrono::local_time<std::chrono::minutes>;

// --------------------- Day integer helpers ---------------------

// Convert std::chrono::year_month_day back to an integer YYYYMMDD.
inline uint32_t ymd_to_day(const std::chrono::year_month_day& ymd) {
  int y        = static_cast<int>(ymd.year());
  unsigned m   = static_cast<unsigned>(ymd.month());
  unsigned dd  = static_cast<unsigned>(ymd.day());
  return static_cast<uint32_t>(y * 10000 + static_cast<int>(m * 100 + dd));
}

// Day integer from a count of days since 1970-01-01 (Arrow date32).
inline uint32_t epoch_days_to_day(int32_t days_since_epoch) {
  using namespace std::chrono;
  return ymd_to_day(year_month_day{sys_days{days{days_since_epoch}}});
}

// Calendar date of a wall-clock reading.
template <class Duration>
inline uint32_t local_day(std::chrono::local_time<Duration> t) {
  using namespace std::chrono;
  return ymd_to_day(year_month_day{floor<days>(t)});
}

// Calendar date (UTC) of an instant.
template <class Duration>
inline uint32_t sys_day(std::chrono::sys_time<Duration> t) {
  using namespace std::chrono;
  return ymd_to_day(year_month_day{floor<days>(t)});
}

// Minutes since local midnight (0-1439).
template <class Duration>
inline int minute_of_day(std::chrono::local_time<Duration> t) {
  using namespace std::chrono;
  return static_cast<int>(
      duration_cast<minutes>(t - floor<days>(t)).count());
}

// Epoch milliseconds, the storage unit of every timestamp column we write.
inline int64_t to_epoch_ms(TimePointMs tp) {
  return tp.time_since_epoch().count();
}

}  // namespace newsret
