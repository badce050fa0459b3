#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "newsret/time_utils.hpp"

namespace newsret {

// Session boundaries in local wall-clock time. Not configurable.
inline constexpr std::chrono::minutes kSessionOpen{9 * 60 + 30};
inline constexpr std::chrono::minutes kRolloverCutoff{16 * 60};

// Initial-reaction horizon for intraday stories.
inline constexpr std::chrono::minutes kReactionHorizon{15};

inline constexpr const char* kDefaultLocalTz = "America/New_York";

// Result of mapping one story timestamp onto the exchange calendar.
//
// trading_date and is_intraday are two independent derivations from the same
// local instant:
//   trading_date: local date, or the next calendar date at/after 16:00
//   is_intraday : local time-of-day in [09:30, 16:00)
struct SessionStamp {
  uint32_t trading_date = 0;  // YYYYMMDD
  bool is_intraday = false;
  uint32_t local_date = 0;    // calendar date of the local instant
  int local_minute = 0;       // minutes since local midnight
};

// Looks up a tz database zone; throws std::runtime_error naming the zone if
// it is unknown.
const std::chrono::time_zone* FindZone(const std::string& name);

// Maps instants onto the trading calendar of one local exchange timezone.
// Holds no mutable state; safe to share across threads.
class TradingCalendar {
 public:
  explicit TradingCalendar(const std::string& local_tz = kDefaultLocalTz);

  // Timezone-aware instant.
  SessionStamp normalize(TimePointMs instant) const;

  // Naive wall-clock reading taken in `origin`. Nonexistent or ambiguous
  // readings around DST transitions resolve to the earliest instant.
  SessionStamp normalize(LocalTimeMs wall,
                         const std::chrono::time_zone* origin) const;

  // origin + kReactionHorizon, floored to the minute.
  static TimePointMs target_instant(TimePointMs origin);

  // Local wall-clock minute of target_instant(origin).
  LocalMinute target_minute(TimePointMs origin) const;

  LocalTimeMs to_local(TimePointMs instant) const;

  static TimePointMs to_sys(LocalTimeMs wall,
                            const std::chrono::time_zone* origin);

  const std::chrono::time_zone* local_zone() const { return local_; }
  std::string local_zone_name() const;

 private:
  const std::chrono::time_zone* local_;
};

}  // namespace newsret
