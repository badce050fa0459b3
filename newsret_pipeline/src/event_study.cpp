#include "newsret/event_study.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "newsret/event_writer.hpp"
#include "newsret/firm_day.hpp"
#include "newsret/minute_quotes.hpp"
#include "newsret/portfolio.hpp"
#include "newsret/price_history.hpp"
#include "newsret/table_reader.hpp"
#include "newsret/timing.hpp"

namespace fs = std::filesystem;

namespace newsret {

namespace {

std::string StoryKey(const std::string& story_id, const std::string& ticker) {
  std::string key;
  key.reserve(story_id.size() + ticker.size() + 1);
  key.append(story_id).push_back('\x1f');
  key.append(ticker);
  return key;
}

std::string OutPath(const std::string& dir, const char* name) {
  return (fs::path(dir) / name).string();
}

}  // namespace

std::vector<Story> JoinLabels(const std::vector<LabelRow>& labels,
                              const std::vector<StoryIndexRow>& index,
                              JoinDiagnostics& diag) {
  std::unordered_map<std::string, const StoryIndexRow*> by_key;
  by_key.reserve(index.size());
  for (const StoryIndexRow& row : index) {
    by_key.try_emplace(StoryKey(row.story_id, row.ticker), &row);
  }

  std::vector<Story> out;
  out.reserve(labels.size());
  for (const LabelRow& label : labels) {
    ++diag.labels_total;
    if (label.ticker.empty()) {
      ++diag.labels_without_ticker;
      continue;
    }
    auto it = by_key.find(StoryKey(label.story_id, label.ticker));
    if (it == by_key.end()) {
      ++diag.labels_unindexed;
      continue;
    }
    const StoryIndexRow& idx = *it->second;

    Story s;
    s.story_id = label.story_id;
    s.ticker = label.ticker;
    s.headline = label.headline;
    s.label_text = label.label_text;
    s.label = label.label;
    s.score = label.score;
    s.date = idx.date;
    s.is_intraday = idx.is_intraday;
    s.target_minute = idx.target_minute;
    out.push_back(std::move(s));
  }
  return out;
}

EventStudy::EventStudy(const PipelineConfig& cfg)
    : cfg_(cfg), calendar_(cfg.local_tz) {
  ValidatePipelineConfig(cfg_);
}

void EventStudy::run() {
  // High-level coordinator:
  //   1. Open every input and validate its schema before reading rows
  //   2. Load tables and build the price / quote indexes
  //   3. Join labels with the story index
  //   4. Compute per-story returns on cfg_.workers threads
  //   5. Aggregate firm-days, build portfolios, summarize
  //   6. Write outputs and print diagnostics + report
  NEWSRET_SCOPE_TIMER("event_study_total");
  ensure_output_dir();

  LabelTable label_table(cfg_.labels_path);
  const std::chrono::time_zone* origin = FindZone(cfg_.origin_tz);
  StoryIndexTable index_table(cfg_.story_index_path, calendar_, origin);
  MinuteQuoteTable quote_table(cfg_.quotes_path, calendar_, origin);
  DailyPriceTable price_table(cfg_.prices_path);

  std::vector<Story> stories;
  {
    NEWSRET_SCOPE_TIMER("load_and_join_stories");
    const std::vector<LabelRow> labels = label_table.load();
    const std::vector<StoryIndexRow> index = index_table.load();
    index_null_key_ = index_table.dropped_null_key();
    stories = JoinLabels(labels, index, diag_);
  }

  PriceHistoryIndex prices;
  {
    NEWSRET_SCOPE_TIMER("index_daily_prices");
    std::vector<DailyPriceRow> rows = price_table.load();
    price_null_key_ = price_table.dropped_null_key();
    price_rows_ = rows.size();
    prices = PriceHistoryIndex(std::move(rows));
    price_duplicates_ = prices.duplicates_dropped();
  }

  MinuteQuoteIndex quotes;
  {
    NEWSRET_SCOPE_TIMER("index_minute_quotes");
    std::vector<MinuteQuoteRow> rows = quote_table.load();
    quotes_null_mid_ = quote_table.dropped_null_mid();
    quote_null_key_ = quote_table.dropped_null_key();
    quote_rows_ = rows.size();
    quotes = MinuteQuoteIndex(std::move(rows));
    quote_duplicates_ = quotes.duplicates_dropped();
  }

  {
    NEWSRET_SCOPE_TIMER("compute_event_returns");
    events_ = ComputeEventReturns(stories, prices, quotes, cfg_.workers,
                                  &diag_);
  }

  {
    NEWSRET_SCOPE_TIMER("aggregate_and_summarize");
    firm_days_ = AggregateFirmDays(events_);
    PortfolioBuilder builder;
    portfolio_ = builder.build(firm_days_);
    report_ = SummarizePerformance(portfolio_, firm_days_.size());
  }

  {
    NEWSRET_SCOPE_TIMER("write_outputs");
    write_outputs();
  }

  print_summary();
  diag_.print(std::cout);
  PrintPerformanceReport(report_, std::cout);
}

void EventStudy::ensure_output_dir() {
  std::error_code ec;
  fs::create_directories(cfg_.out_dir, ec);
  if (ec) {
    throw std::runtime_error("create output directory failed: " +
                             cfg_.out_dir + ": " + ec.message());
  }
}

void EventStudy::write_outputs() {
  EventReturnWriter ev_writer(OutPath(cfg_.out_dir, "event_returns.parquet"));
  for (const EventReturn& ev : events_) ev_writer.append(ev);
  ev_writer.close();

  FirmDayWriter fd_writer(OutPath(cfg_.out_dir, "firm_day.parquet"));
  for (const FirmDay& fd : firm_days_) fd_writer.append(fd);
  fd_writer.close();

  PortfolioWriter pf_writer(OutPath(cfg_.out_dir, "portfolio_daily.parquet"));
  for (const PortfolioDay& day : portfolio_) pf_writer.append(day);
  pf_writer.close();

  WritePerformanceJson(report_, OutPath(cfg_.out_dir, "summary.json"));
}

void EventStudy::print_summary() const {
  std::cout << "=== run_event_study ===\n";
  std::cout << "  labels = " << cfg_.labels_path << "\n";
  std::cout << "  story_index = " << cfg_.story_index_path << "\n";
  std::cout << "  quotes = " << cfg_.quotes_path << "\n";
  std::cout << "  prices = " << cfg_.prices_path << "\n";
  std::cout << "  out_dir = " << cfg_.out_dir << "\n";
  std::cout << "  local_tz = " << cfg_.local_tz << "\n";
  std::cout << "  origin_tz = " << cfg_.origin_tz << "\n";
  std::cout << "  workers = " << cfg_.workers << "\n";
  std::cout << "  index_null_key_dropped = " << index_null_key_ << "\n";
  std::cout << "  price_rows = " << price_rows_ << "\n";
  std::cout << "  price_null_key_dropped = " << price_null_key_ << "\n";
  std::cout << "  price_duplicates_dropped = " << price_duplicates_ << "\n";
  std::cout << "  quote_rows = " << quote_rows_ << "\n";
  std::cout << "  quote_duplicates_dropped = " << quote_duplicates_ << "\n";
  std::cout << "  quotes_null_mid_dropped = " << quotes_null_mid_ << "\n";
  std::cout << "  quote_null_key_dropped = " << quote_null_key_ << "\n";
  std::cout << "  event_rows = " << events_.size() << "\n";
  std::cout << "  firm_days = " << firm_days_.size() << "\n";
  std::cout << "  portfolio_days = " << portfolio_.size() << "\n";
}

}  // namespace newsret
