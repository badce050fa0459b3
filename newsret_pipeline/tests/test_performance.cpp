#include "newsret/performance.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace newsret;

namespace {

PortfolioDay Day(uint32_t date, std::optional<double> drift_ls,
                 std::optional<double> ir_long = std::nullopt) {
  PortfolioDay d;
  d.date = date;
  d.drift_long_short = drift_ls;
  d.ir_long_only = ir_long;
  return d;
}

const SeriesStats& Find(const PerformanceReport& r, Metric m, Leg l) {
  for (const auto& s : r.series) {
    if (s.metric == m && s.leg == l) return s;
  }
  throw std::runtime_error("series not found");
}

}  // namespace

TEST(SummarizeSeriesTest, HitRateIsStrictlyPositive) {
  const SeriesStats s = SummarizeSeries({0.0, 0.01, -0.01, 0.02},
                                        Metric::InitialReaction, Leg::LongOnly);
  EXPECT_EQ(s.n, 4u);
  EXPECT_DOUBLE_EQ(s.hit_rate, 0.5);
  EXPECT_NEAR(s.mean, 0.005, 1e-12);
  EXPECT_FALSE(s.sharpe.has_value());
}

TEST(SummarizeSeriesTest, SampleStandardDeviation) {
  const SeriesStats s =
      SummarizeSeries({1.0, 2.0, 3.0}, Metric::Drift, Leg::LongShort);
  EXPECT_DOUBLE_EQ(s.mean, 2.0);
  EXPECT_DOUBLE_EQ(s.stddev, 1.0);
  ASSERT_TRUE(s.sharpe.has_value());
  EXPECT_NEAR(*s.sharpe, 2.0 * std::sqrt(252.0), 1e-9);
}

TEST(SummarizeSeriesTest, SingleObservationHasZeroStd) {
  const SeriesStats s = SummarizeSeries({0.03}, Metric::Drift, Leg::LongOnly);
  EXPECT_DOUBLE_EQ(s.stddev, 0.0);
  ASSERT_TRUE(s.sharpe.has_value());
  EXPECT_TRUE(std::isnan(*s.sharpe));
}

TEST(SummarizeSeriesTest, ConstantSeriesSharpeIsNaN) {
  const SeriesStats s =
      SummarizeSeries({0.01, 0.01, 0.01}, Metric::Drift, Leg::ShortOnly);
  ASSERT_TRUE(s.sharpe.has_value());
  EXPECT_TRUE(std::isnan(*s.sharpe));
}

TEST(SummarizeSeriesTest, EmptySeriesHasNoData) {
  const SeriesStats s = SummarizeSeries({}, Metric::Drift, Leg::LongShort);
  EXPECT_FALSE(s.has_data());
  EXPECT_EQ(s.n, 0u);
}

TEST(SummarizePerformanceTest, NullDaysDroppedPerSeries) {
  const PerformanceReport r = SummarizePerformance(
      {Day(20240102, 0.01, 0.02), Day(20240103, std::nullopt, 0.04),
       Day(20240104, 0.03)},
      7);
  EXPECT_EQ(r.series.size(), 6u);
  EXPECT_EQ(r.trading_days, 3u);
  EXPECT_EQ(*r.firm_day_count, 7u);

  EXPECT_EQ(Find(r, Metric::Drift, Leg::LongShort).n, 2u);
  EXPECT_EQ(Find(r, Metric::InitialReaction, Leg::LongOnly).n, 2u);
  EXPECT_FALSE(Find(r, Metric::InitialReaction, Leg::ShortOnly).has_data());
}

TEST(SummarizePerformanceTest, ReportPrintsNoDataAndContinues) {
  const PerformanceReport r = SummarizePerformance({Day(20240102, 0.01)});
  std::ostringstream os;
  PrintPerformanceReport(r, os);
  const std::string text = os.str();
  EXPECT_NE(text.find("Initial Reaction | Long-Short: no data"),
            std::string::npos);
  EXPECT_NE(text.find("Drift | Long-Short:"), std::string::npos);
  EXPECT_NE(text.find("Sharpe Ratio : nan"), std::string::npos);
  EXPECT_NE(text.find("Trading Days (total): 1"), std::string::npos);
}

TEST(SummarizePerformanceTest, JsonMarksNoDataAndNullSharpe) {
  const PerformanceReport r =
      SummarizePerformance({Day(20240102, 0.01), Day(20240103, 0.01)}, 4);
  const nlohmann::json j = PerformanceReportToJson(r);

  EXPECT_EQ(j["trading_days"].get<std::size_t>(), 2u);
  EXPECT_EQ(j["firm_day_observations"].get<std::size_t>(), 4u);
  EXPECT_TRUE(j["series"]["ir_long_short"]["no_data"].get<bool>());

  const auto& drift_ls = j["series"]["drift_long_short"];
  EXPECT_FALSE(drift_ls["no_data"].get<bool>());
  EXPECT_EQ(drift_ls["n"].get<std::size_t>(), 2u);
  EXPECT_TRUE(drift_ls["sharpe"].is_null());
  EXPECT_DOUBLE_EQ(drift_ls["hit_rate"].get<double>(), 1.0);
}

TEST(SummarizePerformanceTest, WritesSummaryJson) {
  const auto dir =
      std::filesystem::temp_directory_path() / "newsret_test_performance";
  std::filesystem::remove_all(dir);
  const auto path = (dir / "nested" / "summary.json").string();

  WritePerformanceJson(SummarizePerformance({Day(20240102, 0.01)}), path);

  std::ifstream in(path);
  ASSERT_TRUE(in.good());
  nlohmann::json j;
  in >> j;
  EXPECT_TRUE(j["firm_day_observations"].is_null());
  EXPECT_EQ(j["series"]["drift_long_short"]["n"].get<std::size_t>(), 1u);
  std::filesystem::remove_all(dir);
}

TEST(SeriesColumnTest, Names) {
  EXPECT_EQ(series_column(Metric::Drift, Leg::ShortOnly), "drift_short_only");
  EXPECT_EQ(series_column(Metric::InitialReaction, Leg::LongShort),
            "ir_long_short");
}
