#include "newsret/performance.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace newsret {

namespace {

constexpr Metric kMetrics[] = {Metric::InitialReaction, Metric::Drift};
constexpr Leg kLegs[] = {Leg::LongShort, Leg::LongOnly, Leg::ShortOnly};

const std::optional<double>& Column(const PortfolioDay& d, Metric m, Leg l) {
  if (m == Metric::InitialReaction) {
    switch (l) {
      case Leg::LongShort:
        return d.ir_long_short;
      case Leg::LongOnly:
        return d.ir_long_only;
      case Leg::ShortOnly:
        return d.ir_short_only;
    }
  }
  switch (l) {
    case Leg::LongShort:
      return d.drift_long_short;
    case Leg::LongOnly:
      return d.drift_long_only;
    case Leg::ShortOnly:
      break;
  }
  return d.drift_short_only;
}

}  // namespace

const char* to_string(Metric m) {
  return m == Metric::InitialReaction ? "Initial Reaction" : "Drift";
}

const char* to_string(Leg l) {
  switch (l) {
    case Leg::LongShort:
      return "Long-Short";
    case Leg::LongOnly:
      return "Long-Only";
    case Leg::ShortOnly:
      return "Short-Only";
  }
  return "Long-Short";
}

std::string series_column(Metric m, Leg l) {
  std::string col = (m == Metric::InitialReaction) ? "ir_" : "drift_";
  switch (l) {
    case Leg::LongShort:
      return col + "long_short";
    case Leg::LongOnly:
      return col + "long_only";
    case Leg::ShortOnly:
      return col + "short_only";
  }
  return col;
}

std::vector<double> ExtractSeries(const std::vector<PortfolioDay>& days,
                                  Metric m, Leg l) {
  std::vector<double> values;
  values.reserve(days.size());
  for (const auto& d : days) {
    const auto& v = Column(d, m, l);
    if (v) values.push_back(*v);
  }
  return values;
}

SeriesStats SummarizeSeries(const std::vector<double>& values, Metric m,
                            Leg l) {
  SeriesStats s;
  s.metric = m;
  s.leg = l;
  s.n = values.size();
  if (s.n == 0) return s;

  std::size_t hits = 0;
  double sum = 0.0;
  for (double v : values) {
    sum += v;
    if (v > 0.0) ++hits;
  }
  const double n = static_cast<double>(s.n);
  s.hit_rate = static_cast<double>(hits) / n;
  s.mean = sum / n;

  if (s.n > 1) {
    double ss = 0.0;
    for (double v : values) ss += (v - s.mean) * (v - s.mean);
    s.stddev = std::sqrt(ss / (n - 1.0));
  }

  if (m == Metric::Drift) {
    s.sharpe = (s.stddev > 0.0)
                   ? s.mean / s.stddev * std::sqrt(kTradingDaysPerYear)
                   : std::numeric_limits<double>::quiet_NaN();
  }
  return s;
}

PerformanceReport SummarizePerformance(
    const std::vector<PortfolioDay>& days,
    std::optional<std::size_t> firm_day_count) {
  PerformanceReport report;
  report.trading_days = days.size();
  report.firm_day_count = firm_day_count;
  for (Metric m : kMetrics) {
    for (Leg l : kLegs) {
      report.series.push_back(SummarizeSeries(ExtractSeries(days, m, l), m, l));
    }
  }
  return report;
}

void PrintPerformanceReport(const PerformanceReport& report,
                            std::ostream& out) {
  const auto flags = out.flags();
  const auto prec = out.precision();

  out << "\n" << std::string(70, '=') << "\n";
  out << "News Sentiment Portfolio Performance\n";
  out << std::string(70, '=') << "\n";

  for (const auto& s : report.series) {
    if (!s.has_data()) {
      out << "\n  " << to_string(s.metric) << " | " << to_string(s.leg)
          << ": no data\n";
      continue;
    }
    out << "\n  " << to_string(s.metric) << " | " << to_string(s.leg) << ":\n";
    out << std::fixed;
    out << "    Hit Rate     : " << std::setprecision(1) << s.hit_rate * 100.0
        << "%\n";
    out << "    Mean Return  : " << std::setprecision(4) << s.mean * 100.0
        << "% daily\n";
    if (s.sharpe) {
      out << "    Sharpe Ratio : ";
      if (std::isnan(*s.sharpe)) {
        out << "nan";
      } else {
        out << std::setprecision(2) << *s.sharpe;
      }
      out << " (annualized)\n";
    }
    out << "    Trading Days : " << s.n << "\n";
  }

  out << "\n";
  if (report.firm_day_count) {
    out << "  Firm-Day Observations: " << *report.firm_day_count << "\n";
  }
  out << "  Trading Days (total): " << report.trading_days << "\n";
  out << std::string(70, '=') << "\n";

  out.flags(flags);
  out.precision(prec);
}

nlohmann::json PerformanceReportToJson(const PerformanceReport& report) {
  using nlohmann::json;

  json j;
  j["trading_days"] = report.trading_days;
  j["firm_day_observations"] =
      report.firm_day_count ? json(*report.firm_day_count) : json(nullptr);

  json series = json::object();
  for (const auto& s : report.series) {
    json js;
    js["metric"] = to_string(s.metric);
    js["portfolio"] = to_string(s.leg);
    js["n"] = s.n;
    if (!s.has_data()) {
      js["no_data"] = true;
    } else {
      js["no_data"] = false;
      js["hit_rate"] = s.hit_rate;
      js["mean"] = s.mean;
      js["std"] = s.stddev;
      if (s.metric == Metric::Drift) {
        js["sharpe"] = (s.sharpe && std::isfinite(*s.sharpe))
                           ? json(*s.sharpe)
                           : json(nullptr);
      }
    }
    series[series_column(s.metric, s.leg)] = std::move(js);
  }
  j["series"] = std::move(series);
  return j;
}

void WritePerformanceJson(const PerformanceReport& report,
                          const std::string& out_path) {
  std::filesystem::path p(out_path);
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

  std::ofstream out(out_path);
  if (!out) {
    throw std::runtime_error("Failed to open summary output: " + out_path);
  }
  out << std::setw(2) << PerformanceReportToJson(report) << "\n";
}

}  // namespace newsret
