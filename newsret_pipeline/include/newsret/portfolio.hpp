#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "newsret/event_types.hpp"

namespace newsret {

// Both legs need at least this many firm-days before a long-short return is
// reported for a date.
inline constexpr uint32_t kMinLegFirms = 2;

// Per-date, per-sentiment sums for one grouping pass.
struct LegAccumulator {
  uint32_t n_firms = 0;
  double ir_sum = 0.0;
  uint32_t ir_n = 0;
  double drift_sum = 0.0;
  uint32_t drift_n = 0;

  void add(const FirmDay& fd);
  std::optional<double> ir_mean() const;
  std::optional<double> drift_mean() const;
};

// All firm-days of one date, bucketed by Sentiment.
struct DateBuckets {
  uint32_t date = 0;
  std::array<LegAccumulator, 3> legs{};  // indexed by Sentiment

  const LegAccumulator& leg(Sentiment s) const {
    return legs[static_cast<std::size_t>(s)];
  }
};

// Builds equal-weighted daily portfolios from firm-days.
//
// Dates are independent. For each date:
//   long-only  = mean over positive firm-days (null if none)
//   short-only = -(mean over negative firm-days) (null if none)
//   long-short = long mean - short mean, only when both legs have
//                >= kMinLegFirms firm-days and both means exist
class PortfolioBuilder {
 public:
  // One output row per distinct input date, ascending.
  std::vector<PortfolioDay> build(const std::vector<FirmDay>& firm_days);

  // Group-by pass: firm-days -> per-date leg sums, ascending by date.
  static std::vector<DateBuckets> group_by_date(
      const std::vector<FirmDay>& firm_days);

  // Row for one date's buckets, with the eligibility rule applied.
  static PortfolioDay to_portfolio_day(const DateBuckets& b);

 private:
  void CheckInvariants(const std::vector<PortfolioDay>& rows) const;
};

}  // namespace newsret
