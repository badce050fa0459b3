#include "newsret/price_history.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <vector>

using namespace newsret;

namespace {

DailyPriceRow Row(const char* ticker, uint32_t date, std::optional<double> open,
                  std::optional<double> close) {
  DailyPriceRow r;
  r.ticker = ticker;
  r.date = date;
  r.open = open;
  r.close = close;
  return r;
}

}  // namespace

class PriceHistoryIndexTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Deliberately unsorted, with a negative-flagged row, a duplicate key and
    // a missing day (2024-01-04).
    index_ = PriceHistoryIndex({
        Row("AAPL", 20240105, 103.0, 104.0),
        Row("AAPL", 20240102, -100.0, -101.0),
        Row("MSFT", 20240102, 300.0, 301.0),
        Row("AAPL", 20240103, 102.0, 103.0),
        Row("AAPL", 20240103, 999.0, 999.0),
    });
  }

  PriceHistoryIndex index_;
};

TEST_F(PriceHistoryIndexTest, PricesAreNonNegative) {
  const PriceRecord* rec = index_.find("AAPL", 20240102);
  ASSERT_NE(rec, nullptr);
  EXPECT_DOUBLE_EQ(*rec->open, 100.0);
  EXPECT_DOUBLE_EQ(*rec->close, 101.0);
}

TEST_F(PriceHistoryIndexTest, NeighboursAreNormalizedBeforeShift) {
  const PriceRecord* rec = index_.find("AAPL", 20240103);
  ASSERT_NE(rec, nullptr);
  EXPECT_DOUBLE_EQ(*rec->prev_close, 101.0);
}

TEST_F(PriceHistoryIndexTest, FirstOccurrenceOfDuplicateWins) {
  const PriceRecord* rec = index_.find("AAPL", 20240103);
  ASSERT_NE(rec, nullptr);
  EXPECT_DOUBLE_EQ(*rec->open, 102.0);
  EXPECT_DOUBLE_EQ(*rec->close, 103.0);
  EXPECT_EQ(index_.duplicates_dropped(), 1u);
  EXPECT_EQ(index_.size(), 4u);
  EXPECT_EQ(index_.num_tickers(), 2u);
}

TEST_F(PriceHistoryIndexTest, GapShiftsNeighboursPositionally) {
  // 2024-01-04 is absent: the neighbour of 01-03 is 01-05 and vice versa.
  const PriceRecord* mid = index_.find("AAPL", 20240103);
  ASSERT_NE(mid, nullptr);
  EXPECT_DOUBLE_EQ(*mid->next_close, 104.0);

  const PriceRecord* last = index_.find("AAPL", 20240105);
  ASSERT_NE(last, nullptr);
  EXPECT_DOUBLE_EQ(*last->prev_close, 103.0);
  EXPECT_FALSE(last->next_close.has_value());
}

TEST_F(PriceHistoryIndexTest, SeriesEdgesHaveNoNeighbour) {
  const PriceRecord* first = index_.find("AAPL", 20240102);
  ASSERT_NE(first, nullptr);
  EXPECT_FALSE(first->prev_close.has_value());

  const PriceRecord* only = index_.find("MSFT", 20240102);
  ASSERT_NE(only, nullptr);
  EXPECT_FALSE(only->prev_close.has_value());
  EXPECT_FALSE(only->next_close.has_value());
}

TEST_F(PriceHistoryIndexTest, AbsentKeyIsNotFound) {
  EXPECT_EQ(index_.find("AAPL", 20240104), nullptr);
  EXPECT_EQ(index_.find("TSLA", 20240102), nullptr);
}

TEST(PriceHistoryIndexNullTest, NullCloseStaysNullAndStillOccupiesSlot) {
  PriceHistoryIndex index({
      Row("XYZ", 20240102, 10.0, 11.0),
      Row("XYZ", 20240103, 12.0, std::nullopt),
      Row("XYZ", 20240104, 13.0, 14.0),
  });
  const PriceRecord* mid = index.find("XYZ", 20240103);
  ASSERT_NE(mid, nullptr);
  EXPECT_FALSE(mid->close.has_value());

  const PriceRecord* last = index.find("XYZ", 20240104);
  ASSERT_NE(last, nullptr);
  EXPECT_FALSE(last->prev_close.has_value());
}
