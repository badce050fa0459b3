#include "newsret/story_index_builder.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "parquet_fixture.hpp"

using namespace newsret;
using namespace std::chrono;

namespace {

RawStory Raw(const char* id, const char* ticker, sys_time<milliseconds> t) {
  return RawStory{id, ticker, t};
}

}  // namespace

class StoryIndexBuilderTest : public ::testing::Test {
 protected:
  TradingCalendar calendar_{"America/New_York"};
};

TEST_F(StoryIndexBuilderTest, IntradayStoryGetsLocalTargetMinute) {
  // 11:47:30 EDT
  const IndexedStory idx = IndexStory(
      Raw("s1", "AAA", sys_days{2024y / 3 / 15} + 15h + 47min + 30s),
      calendar_);
  EXPECT_EQ(idx.row.date, 20240315u);
  EXPECT_TRUE(idx.row.is_intraday);
  ASSERT_TRUE(idx.row.target_minute.has_value());
  EXPECT_EQ(*idx.row.target_minute, 12 * 60 + 2);
  ASSERT_TRUE(idx.target_instant.has_value());
  EXPECT_EQ(*idx.target_instant,
            TimePointMs{sys_days{2024y / 3 / 15} + 16h + 2min});
}

TEST_F(StoryIndexBuilderTest, AfterCloseStoryIsOvernightNextDay) {
  // 16:05 EDT
  const IndexedStory idx = IndexStory(
      Raw("s2", "AAA", sys_days{2024y / 3 / 15} + 20h + 5min), calendar_);
  EXPECT_EQ(idx.row.date, 20240316u);
  EXPECT_FALSE(idx.row.is_intraday);
  EXPECT_FALSE(idx.row.target_minute.has_value());
  EXPECT_FALSE(idx.target_instant.has_value());
}

TEST_F(StoryIndexBuilderTest, RunWritesIndexReadableByEventStudy) {
  test::ScratchDir dir("newsret_story_index_builder");
  const std::string in = dir.file("raw.parquet");
  const std::string out = dir.file("index/story_index.parquet");

  const auto t0 = sys_days{2024y / 3 / 15} + 14h;        // 10:00 EDT
  const auto t1 = sys_days{2024y / 3 / 15} + 21h;        // 17:00 EDT
  test::ParquetFixture()
      .strings("story_id", {"s1", "s2", "s3"})
      .strings("ticker", {"AAA", "BBB", std::nullopt})
      .timestamps("timestamp_utc",
                  {to_epoch_ms(TimePointMs{t0}), to_epoch_ms(TimePointMs{t1}),
                   to_epoch_ms(TimePointMs{t0})},
                  "UTC")
      .write(in);

  StoryIndexConfig cfg;
  cfg.in_path = in;
  cfg.out_path = out;
  StoryIndexBuilder builder(cfg);
  builder.run();
  EXPECT_EQ(builder.stories_written(), 2u);
  EXPECT_EQ(builder.intraday_written(), 1u);

  StoryIndexTable table(out, calendar_, FindZone("UTC"));
  const auto rows = table.load();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].story_id, "s1");
  EXPECT_EQ(*rows[0].target_minute, 10 * 60 + 15);
  EXPECT_EQ(rows[1].date, 20240316u);
  EXPECT_FALSE(rows[1].target_minute.has_value());
}
