#pragma once

#include <cstdint>
#include <iosfwd>
#include <vector>

#include "newsret/event_types.hpp"
#include "newsret/minute_quotes.hpp"
#include "newsret/price_history.hpp"

namespace newsret {

// Counts of how stories fared against the price and quote tables. Missing
// data and zero denominators are tallied separately.
struct JoinDiagnostics {
  uint64_t labels_total = 0;
  uint64_t labels_without_ticker = 0;
  uint64_t labels_unindexed = 0;     // no story-index row for the label

  uint64_t stories_total = 0;
  uint64_t intraday_stories = 0;
  uint64_t price_matched = 0;
  uint64_t price_missing = 0;
  uint64_t quote_matched = 0;        // intraday only
  uint64_t quote_missing = 0;        // intraday only

  uint64_t ir_ok = 0;
  uint64_t ir_missing_price = 0;
  uint64_t ir_missing_quote = 0;
  uint64_t ir_zero_denominator = 0;

  uint64_t drift_ok = 0;
  uint64_t drift_missing_price = 0;
  uint64_t drift_zero_denominator = 0;

  void record(const EventReturn& ev);
  void merge(const JoinDiagnostics& o);
  void print(std::ostream& out) const;
};

// Initial reaction and drift for one story.
//
//   intraday : IR    = (mid_t15 - prev_close) / prev_close
//              drift = (next_close - close) / close
//   overnight: IR    = (open - prev_close) / prev_close
//              drift = (close - open) / open
//
// A missing operand or a zero denominator yields a null value with the
// matching ReturnStatus; nothing throws. Pure: no shared state is touched.
EventReturn ComputeEventReturn(const Story& story,
                               const PriceHistoryIndex& prices,
                               const MinuteQuoteIndex& quotes);

// Runs ComputeEventReturn over `stories` on up to `workers` threads, each
// over a contiguous shard. Output order equals input order. Per-shard
// diagnostics are merged into `diag` when it is non-null.
std::vector<EventReturn> ComputeEventReturns(const std::vector<Story>& stories,
                                             const PriceHistoryIndex& prices,
                                             const MinuteQuoteIndex& quotes,
                                             int workers,
                                             JoinDiagnostics* diag = nullptr);

}  // namespace newsret
