#include "newsret/event_returns.hpp"

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <thread>

namespace newsret {

namespace {

struct ReturnResult {
  std::optional<double> value;
  ReturnStatus status = ReturnStatus::kOk;
};

// (to - from) / from, with explicit null and zero guards.
ReturnResult SimpleReturn(const std::optional<double>& to,
                          const std::optional<double>& from,
                          ReturnStatus missing_to) {
  if (!from) return {std::nullopt, ReturnStatus::kMissingPrice};
  if (!to) return {std::nullopt, missing_to};
  if (*from == 0.0) return {std::nullopt, ReturnStatus::kZeroDenominator};
  return {(*to - *from) / *from, ReturnStatus::kOk};
}

}  // namespace

EventReturn ComputeEventReturn(const Story& story,
                               const PriceHistoryIndex& prices,
                               const MinuteQuoteIndex& quotes) {
  EventReturn ev;
  ev.story = story;

  if (const PriceRecord* rec = prices.find(story.ticker, story.date)) {
    ev.price_found = true;
    ev.price = *rec;
  }

  if (story.is_intraday) {
    if (story.target_minute) {
      ev.mid_t15 = quotes.lookup_mid(story.ticker, story.date,
                                     *story.target_minute);
    }

    auto ir = SimpleReturn(ev.mid_t15, ev.price.prev_close,
                           ReturnStatus::kMissingQuote);
    auto dr = SimpleReturn(ev.price.next_close, ev.price.close,
                           ReturnStatus::kMissingPrice);
    ev.initial_reaction = ir.value;
    ev.initial_reaction_status = ir.status;
    ev.drift = dr.value;
    ev.drift_status = dr.status;
  } else {
    auto ir = SimpleReturn(ev.price.open, ev.price.prev_close,
                           ReturnStatus::kMissingPrice);
    auto dr = SimpleReturn(ev.price.close, ev.price.open,
                           ReturnStatus::kMissingPrice);
    ev.initial_reaction = ir.value;
    ev.initial_reaction_status = ir.status;
    ev.drift = dr.value;
    ev.drift_status = dr.status;
  }
  return ev;
}

std::vector<EventReturn> ComputeEventReturns(const std::vector<Story>& stories,
                                             const PriceHistoryIndex& prices,
                                             const MinuteQuoteIndex& quotes,
                                             int workers,
                                             JoinDiagnostics* diag) {
  const std::size_t n = stories.size();
  std::vector<EventReturn> out(n);
  if (n == 0) return out;

  const std::size_t n_shards = std::clamp<std::size_t>(
      static_cast<std::size_t>(std::max(workers, 1)), 1, n);
  const std::size_t shard_len = (n + n_shards - 1) / n_shards;

  std::vector<JoinDiagnostics> shard_diag(n_shards);
  auto run_shard = [&](std::size_t s) {
    const std::size_t lo = s * shard_len;
    const std::size_t hi = std::min(n, lo + shard_len);
    for (std::size_t i = lo; i < hi; ++i) {
      out[i] = ComputeEventReturn(stories[i], prices, quotes);
      shard_diag[s].record(out[i]);
    }
  };

  if (n_shards == 1) {
    run_shard(0);
  } else {
    // jthreads join on scope exit, also when a later spawn throws.
    std::vector<std::jthread> threads;
    threads.reserve(n_shards);
    for (std::size_t s = 0; s < n_shards; ++s) {
      threads.emplace_back(run_shard, s);
    }
  }

  if (diag) {
    for (const auto& d : shard_diag) diag->merge(d);
  }
  return out;
}

// ------------------------- JoinDiagnostics -------------------------

void JoinDiagnostics::record(const EventReturn& ev) {
  ++stories_total;
  if (ev.price_found) {
    ++price_matched;
  } else {
    ++price_missing;
  }
  if (ev.story.is_intraday) {
    ++intraday_stories;
    if (ev.mid_t15) {
      ++quote_matched;
    } else {
      ++quote_missing;
    }
  }

  switch (ev.initial_reaction_status) {
    case ReturnStatus::kOk:
      ++ir_ok;
      break;
    case ReturnStatus::kMissingPrice:
      ++ir_missing_price;
      break;
    case ReturnStatus::kMissingQuote:
      ++ir_missing_quote;
      break;
    case ReturnStatus::kZeroDenominator:
      ++ir_zero_denominator;
      break;
  }

  switch (ev.drift_status) {
    case ReturnStatus::kOk:
      ++drift_ok;
      break;
    case ReturnStatus::kZeroDenominator:
      ++drift_zero_denominator;
      break;
    case ReturnStatus::kMissingPrice:
    case ReturnStatus::kMissingQuote:
      ++drift_missing_price;
      break;
  }
}

void JoinDiagnostics::merge(const JoinDiagnostics& o) {
  labels_total += o.labels_total;
  labels_without_ticker += o.labels_without_ticker;
  labels_unindexed += o.labels_unindexed;
  stories_total += o.stories_total;
  intraday_stories += o.intraday_stories;
  price_matched += o.price_matched;
  price_missing += o.price_missing;
  quote_matched += o.quote_matched;
  quote_missing += o.quote_missing;
  ir_ok += o.ir_ok;
  ir_missing_price += o.ir_missing_price;
  ir_missing_quote += o.ir_missing_quote;
  ir_zero_denominator += o.ir_zero_denominator;
  drift_ok += o.drift_ok;
  drift_missing_price += o.drift_missing_price;
  drift_zero_denominator += o.drift_zero_denominator;
}

void JoinDiagnostics::print(std::ostream& out) const {
  out << "=== join diagnostics ===\n";
  out << "  labels_total = " << labels_total << "\n";
  out << "  labels_without_ticker = " << labels_without_ticker << "\n";
  out << "  labels_unindexed = " << labels_unindexed << "\n";
  out << "  stories = " << stories_total << " (intraday "
      << intraday_stories << ")\n";
  out << "  price matched = " << price_matched << " / " << stories_total
      << " (missing " << price_missing << ")\n";
  out << "  quote t15 matched = " << quote_matched << " / "
      << intraday_stories << " (missing " << quote_missing << ")\n";
  out << "  initial_reaction ok = " << ir_ok
      << " missing_price = " << ir_missing_price
      << " missing_quote = " << ir_missing_quote
      << " zero_denominator = " << ir_zero_denominator << "\n";
  out << "  drift ok = " << drift_ok
      << " missing_price = " << drift_missing_price
      << " zero_denominator = " << drift_zero_denominator << "\n";
}

}  // namespace newsret
