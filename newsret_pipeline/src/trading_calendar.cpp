#include "newsret/trading_calendar.hpp"

#include <stdexcept>

namespace newsret {

const std::chrono::time_zone* FindZone(const std::string& name) {
  try {
    return std::chrono::locate_zone(name);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("unknown timezone '" + name + "': " + e.what());
  }
}

TradingCalendar::TradingCalendar(const std::string& local_tz)
    : local_(FindZone(local_tz)) {}

SessionStamp TradingCalendar::normalize(TimePointMs instant) const {
  using namespace std::chrono;

  const LocalTimeMs local = to_local(instant);
  const local_days day = floor<days>(local);
  const milliseconds tod = local - day;

  SessionStamp s;
  s.local_date = ymd_to_day(year_month_day{day});
  s.local_minute = static_cast<int>(duration_cast<minutes>(tod).count());

  // News at or after the close belongs to the next session.
  s.trading_date = (tod < kRolloverCutoff)
                       ? s.local_date
                       : ymd_to_day(year_month_day{day + days{1}});

  // Start-inclusive at the open, end-exclusive at the close.
  s.is_intraday = (tod >= kSessionOpen && tod < kRolloverCutoff);
  return s;
}

SessionStamp TradingCalendar::normalize(
    LocalTimeMs wall, const std::chrono::time_zone* origin) const {
  return normalize(to_sys(wall, origin));
}

TimePointMs TradingCalendar::target_instant(TimePointMs origin) {
  return std::chrono::floor<std::chrono::minutes>(origin + kReactionHorizon);
}

LocalMinute TradingCalendar::target_minute(TimePointMs origin) const {
  return std::chrono::floor<std::chrono::minutes>(
      to_local(target_instant(origin)));
}

LocalTimeMs TradingCalendar::to_local(TimePointMs instant) const {
  return local_->to_local(instant);
}

TimePointMs TradingCalendar::to_sys(LocalTimeMs wall,
                                    const std::chrono::time_zone* origin) {
  if (!origin) {
    throw std::invalid_argument("TradingCalendar: origin timezone is null");
  }
  return origin->to_sys(wall, std::chrono::choose::earliest);
}

std::string TradingCalendar::local_zone_name() const {
  return std::string(local_->name());
}

}  // namespace newsret
