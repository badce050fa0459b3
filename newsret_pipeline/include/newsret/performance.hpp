#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "newsret/event_types.hpp"

namespace newsret {

inline constexpr double kTradingDaysPerYear = 252.0;

enum class Metric { InitialReaction, Drift };
enum class Leg { LongShort, LongOnly, ShortOnly };

const char* to_string(Metric m);
const char* to_string(Leg l);

// Portfolio-day column for a metric/leg pair, e.g. "drift_short_only".
std::string series_column(Metric m, Leg l);

// Summary statistics of one daily return series, null days dropped.
struct SeriesStats {
  Metric metric = Metric::InitialReaction;
  Leg leg = Leg::LongShort;

  std::size_t n = 0;       // non-null days
  double hit_rate = 0.0;   // fraction of days with value > 0
  double mean = 0.0;       // per period
  double stddev = 0.0;     // sample (N-1); 0 when n < 2

  // mean / stddev * sqrt(252); drift metrics only. NaN when stddev == 0.
  std::optional<double> sharpe;

  bool has_data() const { return n > 0; }
};

struct PerformanceReport {
  std::vector<SeriesStats> series;            // metric x leg
  std::size_t trading_days = 0;
  std::optional<std::size_t> firm_day_count;  // unknown when summarizing a
                                              // stored portfolio table
};

// Values of one metric/leg series across days, nulls dropped.
std::vector<double> ExtractSeries(const std::vector<PortfolioDay>& days,
                                  Metric m, Leg l);

SeriesStats SummarizeSeries(const std::vector<double>& values, Metric m,
                            Leg l);

// All six metric/leg combinations. Empty series are reported as "no data";
// nothing throws.
PerformanceReport SummarizePerformance(
    const std::vector<PortfolioDay>& days,
    std::optional<std::size_t> firm_day_count = std::nullopt);

void PrintPerformanceReport(const PerformanceReport& report,
                            std::ostream& out);

nlohmann::json PerformanceReportToJson(const PerformanceReport& report);

void WritePerformanceJson(const PerformanceReport& report,
                          const std::string& out_path);

}  // namespace newsret
