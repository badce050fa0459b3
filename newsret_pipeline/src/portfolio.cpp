#include "newsret/portfolio.hpp"

#include <algorithm>
#include <cassert>
#include <map>

namespace newsret {

namespace {

std::optional<double> Negate(const std::optional<double>& v) {
  if (!v) return std::nullopt;
  return -*v;
}

// long - short, only when both are present.
std::optional<double> Spread(const std::optional<double>& long_mean,
                             const std::optional<double>& short_mean) {
  if (!long_mean || !short_mean) return std::nullopt;
  return *long_mean - *short_mean;
}

}  // namespace

void LegAccumulator::add(const FirmDay& fd) {
  ++n_firms;
  if (fd.initial_reaction) {
    ir_sum += *fd.initial_reaction;
    ++ir_n;
  }
  if (fd.drift) {
    drift_sum += *fd.drift;
    ++drift_n;
  }
}

std::optional<double> LegAccumulator::ir_mean() const {
  if (ir_n == 0) return std::nullopt;
  return ir_sum / static_cast<double>(ir_n);
}

std::optional<double> LegAccumulator::drift_mean() const {
  if (drift_n == 0) return std::nullopt;
  return drift_sum / static_cast<double>(drift_n);
}

std::vector<DateBuckets> PortfolioBuilder::group_by_date(
    const std::vector<FirmDay>& firm_days) {
  std::map<uint32_t, DateBuckets> by_date;
  for (const auto& fd : firm_days) {
    auto& b = by_date[fd.date];
    b.date = fd.date;
    b.legs[static_cast<std::size_t>(fd.sentiment)].add(fd);
  }

  std::vector<DateBuckets> out;
  out.reserve(by_date.size());
  for (auto& [date, b] : by_date) out.push_back(b);
  return out;
}

PortfolioDay PortfolioBuilder::to_portfolio_day(const DateBuckets& b) {
  const LegAccumulator& pos = b.leg(Sentiment::Positive);
  const LegAccumulator& neg = b.leg(Sentiment::Negative);

  PortfolioDay row;
  row.date = b.date;
  row.n_positive = pos.n_firms;
  row.n_negative = neg.n_firms;
  row.n_neutral = b.leg(Sentiment::Neutral).n_firms;

  row.ir_long_only = pos.ir_mean();
  row.ir_short_only = Negate(neg.ir_mean());
  row.drift_long_only = pos.drift_mean();
  row.drift_short_only = Negate(neg.drift_mean());

  // Single-name risk control: no long-short unless both legs are diversified.
  const bool eligible =
      pos.n_firms >= kMinLegFirms && neg.n_firms >= kMinLegFirms;
  if (eligible) {
    row.ir_long_short = Spread(pos.ir_mean(), neg.ir_mean());
    row.drift_long_short = Spread(pos.drift_mean(), neg.drift_mean());
  }
  return row;
}

std::vector<PortfolioDay> PortfolioBuilder::build(
    const std::vector<FirmDay>& firm_days) {
  const std::vector<DateBuckets> buckets = group_by_date(firm_days);

  std::vector<PortfolioDay> rows(buckets.size());
  std::transform(buckets.begin(), buckets.end(), rows.begin(),
                 &PortfolioBuilder::to_portfolio_day);

  CheckInvariants(rows);
  return rows;
}

void PortfolioBuilder::CheckInvariants(
    const std::vector<PortfolioDay>& rows) const {
#ifndef NDEBUG
  uint32_t prev_day = 0;
  for (const auto& row : rows) {
    // Invariant 1: rows are strictly increasing in date.
    assert(row.date > prev_day || (prev_day == 0 && row.date == 0));
    prev_day = row.date;

    // Invariant 2: an empty leg has no mean.
    if (row.n_positive == 0) {
      assert(!row.ir_long_only && !row.drift_long_only);
    }
    if (row.n_negative == 0) {
      assert(!row.ir_short_only && !row.drift_short_only);
    }

    // Invariant 3: long-short only on eligible dates.
    if (row.n_positive < kMinLegFirms || row.n_negative < kMinLegFirms) {
      assert(!row.ir_long_short && !row.drift_long_short);
    }
  }
#else
  (void)rows;
#endif
}

}  // namespace newsret
