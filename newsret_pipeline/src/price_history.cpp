#include "newsret/price_history.hpp"

#include <algorithm>
#include <cmath>

namespace newsret {

namespace {

std::optional<double> AbsPrice(const std::optional<double>& p) {
  if (!p) return std::nullopt;
  return std::fabs(*p);
}

}  // namespace

PriceHistoryIndex::PriceHistoryIndex(std::vector<DailyPriceRow> rows) {
  // Stable sort keeps input order among duplicate keys, so the first
  // occurrence survives the de-duplication below.
  std::stable_sort(rows.begin(), rows.end(),
                   [](const DailyPriceRow& a, const DailyPriceRow& b) {
                     if (a.ticker != b.ticker) return a.ticker < b.ticker;
                     return a.date < b.date;
                   });

  std::size_t i = 0;
  while (i < rows.size()) {
    // [i, j) is one ticker's series
    std::size_t j = i;
    while (j < rows.size() && rows[j].ticker == rows[i].ticker) ++j;

    std::vector<DatedRecord> series;
    series.reserve(j - i);
    for (std::size_t k = i; k < j; ++k) {
      if (!series.empty() && series.back().first == rows[k].date) {
        ++duplicates_dropped_;
        continue;
      }
      PriceRecord rec;
      rec.open = AbsPrice(rows[k].open);
      rec.close = AbsPrice(rows[k].close);
      series.emplace_back(rows[k].date, rec);
    }

    // Shift by one within the ticker, after sign normalization.
    for (std::size_t k = 0; k < series.size(); ++k) {
      if (k > 0) series[k].second.prev_close = series[k - 1].second.close;
      if (k + 1 < series.size()) {
        series[k].second.next_close = series[k + 1].second.close;
      }
    }

    n_records_ += series.size();
    by_ticker_.emplace(rows[i].ticker, std::move(series));
    i = j;
  }
}

const PriceRecord* PriceHistoryIndex::find(const std::string& ticker,
                                           uint32_t date) const {
  auto it = by_ticker_.find(ticker);
  if (it == by_ticker_.end()) return nullptr;

  const auto& series = it->second;
  auto pos = std::lower_bound(
      series.begin(), series.end(), date,
      [](const DatedRecord& r, uint32_t d) { return r.first < d; });
  if (pos == series.end() || pos->first != date) return nullptr;
  return &pos->second;
}

}  // namespace newsret
