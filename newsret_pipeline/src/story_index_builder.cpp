#include "newsret/story_index_builder.hpp"

#include <iostream>

#include "newsret/event_writer.hpp"
#include "newsret/timing.hpp"

namespace newsret {

IndexedStory IndexStory(const RawStory& story,
                        const TradingCalendar& calendar) {
  const SessionStamp s = calendar.normalize(story.timestamp);

  IndexedStory out;
  out.row.story_id = story.story_id;
  out.row.ticker = story.ticker;
  out.row.date = s.trading_date;
  out.row.is_intraday = s.is_intraday;
  if (s.is_intraday) {
    out.target_instant = TradingCalendar::target_instant(story.timestamp);
    out.row.target_minute =
        minute_of_day(calendar.target_minute(story.timestamp));
  }
  return out;
}

StoryIndexBuilder::StoryIndexBuilder(const StoryIndexConfig& cfg)
    : cfg_(cfg), calendar_(cfg.local_tz) {}

void StoryIndexBuilder::run() {
  // 1. Open and validate the raw table (schema errors surface here)
  // 2. Normalize every story onto the trading calendar
  // 3. Write the index and print a summary
  RawStoryTable table(cfg_.in_path, FindZone(cfg_.origin_tz));

  std::vector<RawStory> stories;
  {
    NEWSRET_SCOPE_TIMER("load_raw_stories");
    stories = table.load();
  }
  read_ = stories.size();

  NEWSRET_SCOPE_TIMER("write_story_index");
  StoryIndexWriter writer(cfg_.out_path, cfg_.local_tz);
  for (const RawStory& story : stories) {
    const IndexedStory idx = IndexStory(story, calendar_);
    if (idx.row.is_intraday) ++intraday_;
    if (idx.row.date != local_day(calendar_.to_local(story.timestamp))) {
      ++rolled_forward_;
    }
    writer.append(idx.row, idx.target_instant);
    ++written_;
  }
  writer.close();

  print_summary(table);
}

void StoryIndexBuilder::print_summary(const RawStoryTable& table) const {
  std::cout << "=== build_story_index ===\n";
  std::cout << "  in = " << cfg_.in_path << "\n";
  std::cout << "  out = " << cfg_.out_path << "\n";
  std::cout << "  local_tz = " << cfg_.local_tz << "\n";
  std::cout << "  origin_tz = " << cfg_.origin_tz << " (naive timestamps)\n";
  std::cout << "  stories_read = " << read_ << "\n";
  std::cout << "  skipped_no_ticker = " << table.skipped_no_ticker() << "\n";
  std::cout << "  skipped_no_timestamp = " << table.skipped_no_timestamp()
            << "\n";
  std::cout << "  stories_written = " << written_ << "\n";
  std::cout << "  intraday = " << intraday_ << "\n";
  std::cout << "  overnight = " << (written_ - intraday_) << "\n";
  std::cout << "  rolled_to_next_day = " << rolled_forward_ << "\n";
}

}  // namespace newsret
