#include "newsret/event_returns.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using namespace newsret;

namespace {

Story MakeStory(const char* id, const char* ticker, uint32_t date,
                bool intraday, std::optional<int> target = std::nullopt) {
  Story s;
  s.story_id = id;
  s.ticker = ticker;
  s.date = date;
  s.is_intraday = intraday;
  s.target_minute = target;
  s.score = 0.7;
  return s;
}

DailyPriceRow Price(const char* ticker, uint32_t date, double open,
                    double close) {
  DailyPriceRow r;
  r.ticker = ticker;
  r.date = date;
  r.open = open;
  r.close = close;
  return r;
}

}  // namespace

class EventReturnTest : public ::testing::Test {
 protected:
  void SetUp() override {
    prices_ = PriceHistoryIndex({
        Price("XYZ", 20240102, 99.0, 100.0),
        Price("XYZ", 20240103, 102.0, 104.0),
        Price("XYZ", 20240104, 105.0, 110.0),
        Price("ZERO", 20240102, 1.0, 0.0),
        Price("ZERO", 20240103, 0.0, 5.0),
    });
    quotes_ = MinuteQuoteIndex({{"XYZ", 20240103, 600, 101.0}});
  }

  PriceHistoryIndex prices_;
  MinuteQuoteIndex quotes_;
};

TEST_F(EventReturnTest, IntradayUsesQuoteAndNextClose) {
  const EventReturn ev = ComputeEventReturn(
      MakeStory("s1", "XYZ", 20240103, true, 600), prices_, quotes_);
  ASSERT_TRUE(ev.initial_reaction.has_value());
  EXPECT_DOUBLE_EQ(*ev.mid_t15, 101.0);
  EXPECT_NEAR(*ev.initial_reaction, (101.0 - 100.0) / 100.0, 1e-12);
  ASSERT_TRUE(ev.drift.has_value());
  EXPECT_NEAR(*ev.drift, (110.0 - 104.0) / 104.0, 1e-12);
  EXPECT_EQ(ev.initial_reaction_status, ReturnStatus::kOk);
  EXPECT_EQ(ev.drift_status, ReturnStatus::kOk);
}

TEST_F(EventReturnTest, OvernightUsesOpenAndClose) {
  const EventReturn ev = ComputeEventReturn(
      MakeStory("s2", "XYZ", 20240103, false), prices_, quotes_);
  ASSERT_TRUE(ev.initial_reaction.has_value());
  EXPECT_NEAR(*ev.initial_reaction, (102.0 - 100.0) / 100.0, 1e-12);
  ASSERT_TRUE(ev.drift.has_value());
  EXPECT_NEAR(*ev.drift, (104.0 - 102.0) / 102.0, 1e-12);
  EXPECT_FALSE(ev.mid_t15.has_value());
}

TEST_F(EventReturnTest, MissingQuoteKeepsDrift) {
  const EventReturn ev = ComputeEventReturn(
      MakeStory("s3", "XYZ", 20240103, true, 601), prices_, quotes_);
  EXPECT_FALSE(ev.initial_reaction.has_value());
  EXPECT_EQ(ev.initial_reaction_status, ReturnStatus::kMissingQuote);
  ASSERT_TRUE(ev.drift.has_value());
  EXPECT_NEAR(*ev.drift, (110.0 - 104.0) / 104.0, 1e-12);
}

TEST_F(EventReturnTest, MissingPriceRowIsNullNotError) {
  const EventReturn ev = ComputeEventReturn(
      MakeStory("s4", "XYZ", 20240110, false), prices_, quotes_);
  EXPECT_FALSE(ev.price_found);
  EXPECT_FALSE(ev.initial_reaction.has_value());
  EXPECT_FALSE(ev.drift.has_value());
  EXPECT_EQ(ev.initial_reaction_status, ReturnStatus::kMissingPrice);
  EXPECT_EQ(ev.drift_status, ReturnStatus::kMissingPrice);
}

TEST_F(EventReturnTest, LastDayHasNoDrift) {
  const EventReturn ev = ComputeEventReturn(
      MakeStory("s5", "XYZ", 20240104, true, 600), prices_, quotes_);
  EXPECT_EQ(ev.drift_status, ReturnStatus::kMissingPrice);
  EXPECT_FALSE(ev.drift.has_value());
}

TEST_F(EventReturnTest, ZeroDenominatorIsCountedSeparately) {
  // prev_close 0 and open 0 on 2024-01-03.
  const EventReturn ev = ComputeEventReturn(
      MakeStory("s6", "ZERO", 20240103, false), prices_, quotes_);
  EXPECT_FALSE(ev.initial_reaction.has_value());
  EXPECT_EQ(ev.initial_reaction_status, ReturnStatus::kZeroDenominator);
  EXPECT_FALSE(ev.drift.has_value());
  EXPECT_EQ(ev.drift_status, ReturnStatus::kZeroDenominator);

  JoinDiagnostics diag;
  diag.record(ev);
  EXPECT_EQ(diag.ir_zero_denominator, 1u);
  EXPECT_EQ(diag.ir_missing_price, 0u);
  EXPECT_EQ(diag.drift_zero_denominator, 1u);
  EXPECT_EQ(diag.price_matched, 1u);
}

TEST_F(EventReturnTest, ParallelMatchesSequentialAndKeepsOrder) {
  std::vector<Story> stories;
  for (int i = 0; i < 103; ++i) {
    const std::string id = "s" + std::to_string(i);
    switch (i % 4) {
      case 0:
        stories.push_back(MakeStory(id.c_str(), "XYZ", 20240103, true, 600));
        break;
      case 1:
        stories.push_back(MakeStory(id.c_str(), "XYZ", 20240103, true, 601));
        break;
      case 2:
        stories.push_back(MakeStory(id.c_str(), "XYZ", 20240104, false));
        break;
      default:
        stories.push_back(MakeStory(id.c_str(), "NONE", 20240103, false));
        break;
    }
  }

  JoinDiagnostics seq_diag;
  JoinDiagnostics par_diag;
  const auto seq = ComputeEventReturns(stories, prices_, quotes_, 1, &seq_diag);
  const auto par = ComputeEventReturns(stories, prices_, quotes_, 8, &par_diag);

  ASSERT_EQ(seq.size(), stories.size());
  ASSERT_EQ(par.size(), stories.size());
  for (std::size_t i = 0; i < stories.size(); ++i) {
    EXPECT_EQ(par[i].story.story_id, stories[i].story_id);
    EXPECT_EQ(par[i].initial_reaction, seq[i].initial_reaction);
    EXPECT_EQ(par[i].drift, seq[i].drift);
  }

  EXPECT_EQ(par_diag.stories_total, 103u);
  EXPECT_EQ(par_diag.intraday_stories, seq_diag.intraday_stories);
  EXPECT_EQ(par_diag.quote_matched, 26u);
  EXPECT_EQ(par_diag.quote_missing, 26u);
  EXPECT_EQ(par_diag.price_missing, 25u);
  EXPECT_EQ(par_diag.ir_missing_quote, seq_diag.ir_missing_quote);
}

TEST_F(EventReturnTest, MoreWorkersThanStoriesRunsOneShardEach) {
  const std::vector<Story> stories = {
      MakeStory("a", "XYZ", 20240103, true, 600),
      MakeStory("b", "XYZ", 20240104, false),
      MakeStory("c", "NONE", 20240103, false),
  };

  // Repeated so a shard that outlives the call would show up as a torn count.
  for (int round = 0; round < 20; ++round) {
    JoinDiagnostics diag;
    const auto out = ComputeEventReturns(stories, prices_, quotes_, 64, &diag);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].story.story_id, "a");
    EXPECT_EQ(out[2].story.story_id, "c");
    EXPECT_EQ(diag.stories_total, 3u);
    EXPECT_EQ(diag.price_matched, 2u);
    EXPECT_EQ(diag.price_missing, 1u);
    EXPECT_EQ(diag.quote_matched, 1u);
  }
}

TEST_F(EventReturnTest, EmptyInput) {
  JoinDiagnostics diag;
  EXPECT_TRUE(ComputeEventReturns({}, prices_, quotes_, 4, &diag).empty());
  EXPECT_EQ(diag.stories_total, 0u);
}

TEST(JoinDiagnosticsTest, PrintsHeader) {
  JoinDiagnostics diag;
  diag.labels_total = 3;
  std::ostringstream os;
  diag.print(os);
  EXPECT_NE(os.str().find("=== join diagnostics ==="), std::string::npos);
  EXPECT_NE(os.str().find("labels_total = 3"), std::string::npos);
}
