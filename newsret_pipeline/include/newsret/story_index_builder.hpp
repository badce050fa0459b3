#pragma once

#include <cstdint>
#include <optional>

#include "newsret/event_types.hpp"
#include "newsret/pipeline_config.hpp"
#include "newsret/table_reader.hpp"
#include "newsret/trading_calendar.hpp"

namespace newsret {

// Index row for one raw story plus the t+15 instant written to the
// target_minute column. Both target fields are empty for overnight stories.
struct IndexedStory {
  StoryIndexRow row;
  std::optional<TimePointMs> target_instant;
};

IndexedStory IndexStory(const RawStory& story, const TradingCalendar& calendar);

// Reads raw stories, maps each onto the trading calendar, and writes the
// intraday story index consumed by run_event_study.
class StoryIndexBuilder {
 public:
  explicit StoryIndexBuilder(const StoryIndexConfig& cfg);

  void run();

  uint64_t stories_written() const { return written_; }
  uint64_t intraday_written() const { return intraday_; }

 private:
  void print_summary(const RawStoryTable& table) const;

  StoryIndexConfig cfg_;
  TradingCalendar calendar_;
  uint64_t read_ = 0;
  uint64_t written_ = 0;
  uint64_t intraday_ = 0;
  uint64_t rolled_forward_ = 0;
};

}  // namespace newsret
