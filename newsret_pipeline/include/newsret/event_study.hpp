#pragma once

#include <vector>

#include "newsret/event_returns.hpp"
#include "newsret/event_types.hpp"
#include "newsret/performance.hpp"
#include "newsret/pipeline_config.hpp"
#include "newsret/trading_calendar.hpp"

namespace newsret {

// Inner join of labels with the story index on (story_id, ticker), in label
// order. Labels without a ticker or without an index row are dropped and
// counted in `diag`. Duplicate index rows keep the first.
std::vector<Story> JoinLabels(const std::vector<LabelRow>& labels,
                              const std::vector<StoryIndexRow>& index,
                              JoinDiagnostics& diag);

// Runs the whole event study for one configuration:
//   labels + story index -> stories
//   stories x prices x quotes -> event_returns.parquet
//   -> firm_day.parquet -> portfolio_daily.parquet -> summary.json
class EventStudy {
 public:
  explicit EventStudy(const PipelineConfig& cfg);

  void run();

  const std::vector<EventReturn>& events() const { return events_; }
  const std::vector<FirmDay>& firm_days() const { return firm_days_; }
  const std::vector<PortfolioDay>& portfolio() const { return portfolio_; }
  const PerformanceReport& report() const { return report_; }
  const JoinDiagnostics& diagnostics() const { return diag_; }

 private:
  void ensure_output_dir();
  void write_outputs();
  void print_summary() const;

  PipelineConfig cfg_;
  TradingCalendar calendar_;

  JoinDiagnostics diag_;
  std::vector<EventReturn> events_;
  std::vector<FirmDay> firm_days_;
  std::vector<PortfolioDay> portfolio_;
  PerformanceReport report_;

  std::size_t price_rows_ = 0;
  std::size_t price_duplicates_ = 0;
  std::size_t quote_rows_ = 0;
  std::size_t quote_duplicates_ = 0;
  uint64_t quotes_null_mid_ = 0;
  uint64_t index_null_key_ = 0;
  uint64_t price_null_key_ = 0;
  uint64_t quote_null_key_ = 0;
};

}  // namespace newsret
