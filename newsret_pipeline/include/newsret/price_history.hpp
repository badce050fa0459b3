#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "newsret/event_types.hpp"

namespace newsret {

// One row of the raw daily price panel. Prices may be negative (vendor flag
// encoding) or null.
struct DailyPriceRow {
  std::string ticker;
  uint32_t date = 0;  // YYYYMMDD
  std::optional<double> open;
  std::optional<double> close;
};

// Per-instrument daily price history with positional prev/next closes.
//
// Rows are de-duplicated on (ticker, date), keeping the first occurrence in
// input order, and sorted by date within each ticker. Prices are made
// non-negative before the shift, so prev_close/next_close agree in sign with
// close. Neighbours are positional: a gap in the series shifts them.
class PriceHistoryIndex {
 public:
  PriceHistoryIndex() = default;
  explicit PriceHistoryIndex(std::vector<DailyPriceRow> rows);

  // nullptr when (ticker, date) is absent. Absence is a missing-value
  // condition for the caller, not an error.
  const PriceRecord* find(const std::string& ticker, uint32_t date) const;

  std::size_t size() const { return n_records_; }
  std::size_t num_tickers() const { return by_ticker_.size(); }
  std::size_t duplicates_dropped() const { return duplicates_dropped_; }

 private:
  using DatedRecord = std::pair<uint32_t, PriceRecord>;

  std::unordered_map<std::string, std::vector<DatedRecord>> by_ticker_;
  std::size_t n_records_ = 0;
  std::size_t duplicates_dropped_ = 0;
};

}  // namespace newsret
