#pragma once

#include <arrow/api.h>
#include <parquet/arrow/reader.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "newsret/event_types.hpp"
#include "newsret/minute_quotes.hpp"
#include "newsret/price_history.hpp"
#include "newsret/time_utils.hpp"
#include "newsret/trading_calendar.hpp"

namespace newsret {

// Physical encodings accepted for a logical column.
enum class ColumnKind { String, Number, Integer, Bool, Day, Timestamp };

// Streams one Parquet table, projected to the columns callers require.
//
// Usage: construct, call require() for every needed column (throws
// SchemaViolation naming the table and column), then for_each_batch().
// Constructing and requiring every input before reading any of them gives
// the fail-before-compute behaviour for schema errors.
class ParquetTableReader {
 public:
  ParquetTableReader(std::string path, std::string table_name);

  // Returns the first of `names` present in the schema. Throws
  // SchemaViolation (naming the first alias) when none is, or when the
  // column's type does not fit `kind`.
  std::string require(std::initializer_list<const char*> names,
                      ColumnKind kind);

  // Optional column: the name if present with a usable type, else "".
  std::string optional(const char* name, ColumnKind kind);

  // Streams record batches over all row groups, restricted to the required
  // and optional columns resolved so far.
  void for_each_batch(
      const std::function<void(const arrow::RecordBatch&)>& fn);

  const std::string& path() const { return path_; }
  const std::string& table_name() const { return table_; }
  int64_t num_rows() const;

  // Column of `batch` by resolved name; throws SchemaViolation if absent.
  std::shared_ptr<arrow::Array> column(const arrow::RecordBatch& batch,
                                       const std::string& name) const;

 private:
  bool accepts(const arrow::DataType& type, ColumnKind kind) const;
  void project(int field_index);

  std::string path_;
  std::string table_;
  std::shared_ptr<arrow::Schema> schema_;
  std::unique_ptr<parquet::arrow::FileReader> reader_;
  std::vector<int> projected_;
};

// Raw story before calendar normalization (build_story_index input).
struct RawStory {
  std::string story_id;
  std::string ticker;
  TimePointMs timestamp;
};

// --- Table loaders. Each opens and validates its table on construction and
// --- materialises rows on load().

class RawStoryTable {
 public:
  // Naive timestamps are read as wall-clock time in `origin`.
  RawStoryTable(const std::string& path, const std::chrono::time_zone* origin);
  std::vector<RawStory> load();
  uint64_t skipped_no_ticker() const { return skipped_no_ticker_; }
  uint64_t skipped_no_timestamp() const { return skipped_no_timestamp_; }

 private:
  ParquetTableReader reader_;
  const std::chrono::time_zone* origin_;
  std::string id_col_, ticker_col_, ts_col_;
  uint64_t skipped_no_ticker_ = 0;
  uint64_t skipped_no_timestamp_ = 0;
};

class LabelTable {
 public:
  explicit LabelTable(const std::string& path);
  std::vector<LabelRow> load();

 private:
  ParquetTableReader reader_;
  std::string id_col_, ticker_col_, headline_col_, label_col_, score_col_;
};

class StoryIndexTable {
 public:
  // Zoned target_minute values are converted into the calendar's local zone;
  // naive ones are wall-clock time in `origin`.
  StoryIndexTable(const std::string& path, const TradingCalendar& calendar,
                  const std::chrono::time_zone* origin);
  std::vector<StoryIndexRow> load();

  // Rows without story_id, ticker or date.
  uint64_t dropped_null_key() const { return dropped_null_key_; }

 private:
  ParquetTableReader reader_;
  const TradingCalendar& calendar_;
  const std::chrono::time_zone* origin_;
  std::string id_col_, ticker_col_, date_col_, intraday_col_, target_col_;
  uint64_t dropped_null_key_ = 0;
};

class MinuteQuoteTable {
 public:
  // Naive minute timestamps are wall-clock time in `origin`.
  MinuteQuoteTable(const std::string& path, const TradingCalendar& calendar,
                   const std::chrono::time_zone* origin);
  std::vector<MinuteQuoteRow> load();
  uint64_t dropped_null_mid() const { return dropped_null_mid_; }
  // Rows without ticker, date or minute.
  uint64_t dropped_null_key() const { return dropped_null_key_; }

 private:
  ParquetTableReader reader_;
  const TradingCalendar& calendar_;
  const std::chrono::time_zone* origin_;
  std::string date_col_, minute_col_, mid_col_;
  std::string ticker_col_, root_col_, suffix_col_;
  uint64_t dropped_null_mid_ = 0;
  uint64_t dropped_null_key_ = 0;
};

class DailyPriceTable {
 public:
  explicit DailyPriceTable(const std::string& path);
  std::vector<DailyPriceRow> load();

  // Rows without date or ticker.
  uint64_t dropped_null_key() const { return dropped_null_key_; }

 private:
  ParquetTableReader reader_;
  std::string date_col_, ticker_col_, open_col_, close_col_;
  uint64_t dropped_null_key_ = 0;
};

// Reads a portfolio_daily table written by PortfolioWriter.
std::vector<PortfolioDay> ReadPortfolioDays(const std::string& path);

}  // namespace newsret
