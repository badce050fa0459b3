#include "newsret/table_reader.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

#include "newsret/arrow_utils.hpp"
#include "newsret/sentiment.hpp"

namespace newsret {

namespace {

const char* KindName(ColumnKind kind) {
  switch (kind) {
    case ColumnKind::String:
      return "string";
    case ColumnKind::Number:
      return "numeric";
    case ColumnKind::Integer:
      return "integer";
    case ColumnKind::Bool:
      return "boolean";
    case ColumnKind::Day:
      return "date";
    case ColumnKind::Timestamp:
      return "timestamp";
  }
  return "?";
}

// Wall-clock reading of a timestamp cell in the calendar's local zone. Naive
// cells are wall-clock time in `origin`.
LocalTimeMs LocalReading(const TimestampCell& cell,
                         const TradingCalendar& calendar,
                         const std::chrono::time_zone* origin) {
  if (cell.zoned) return calendar.to_local(TimePointMs{cell.value});
  return calendar.to_local(
      TradingCalendar::to_sys(LocalTimeMs{cell.value}, origin));
}

void RequireOrigin(const std::chrono::time_zone* origin, const char* table) {
  if (!origin) {
    throw std::invalid_argument(std::string(table) +
                                ": origin timezone is required");
  }
}

}  // namespace

// ------------------------- ParquetTableReader -------------------------

ParquetTableReader::ParquetTableReader(std::string path,
                                       std::string table_name)
    : path_(std::move(path)), table_(std::move(table_name)) {
  reader_ = open_parquet_reader(path_, schema_);
  if (!schema_) {
    throw std::runtime_error(table_ + ": input schema is null");
  }
}

bool ParquetTableReader::accepts(const arrow::DataType& type,
                                 ColumnKind kind) const {
  switch (kind) {
    case ColumnKind::String:
      return type.id() == arrow::Type::STRING ||
             type.id() == arrow::Type::LARGE_STRING;
    case ColumnKind::Number:
      return type.id() == arrow::Type::FLOAT ||
             type.id() == arrow::Type::DOUBLE ||
             type.id() == arrow::Type::INT32 ||
             type.id() == arrow::Type::INT64;
    case ColumnKind::Integer:
      return type.id() == arrow::Type::INT32 ||
             type.id() == arrow::Type::UINT32 ||
             type.id() == arrow::Type::INT64 ||
             type.id() == arrow::Type::UINT64;
    case ColumnKind::Bool:
      return type.id() == arrow::Type::BOOL || type.id() == arrow::Type::INT8;
    case ColumnKind::Day:
      return type.id() == arrow::Type::DATE32 ||
             type.id() == arrow::Type::DATE64 ||
             type.id() == arrow::Type::INT32 ||
             type.id() == arrow::Type::UINT32 ||
             type.id() == arrow::Type::INT64 ||
             type.id() == arrow::Type::UINT64 ||
             type.id() == arrow::Type::TIMESTAMP;
    case ColumnKind::Timestamp:
      return type.id() == arrow::Type::TIMESTAMP;
  }
  return false;
}

void ParquetTableReader::project(int field_index) {
  if (std::find(projected_.begin(), projected_.end(), field_index) ==
      projected_.end()) {
    projected_.push_back(field_index);
    std::sort(projected_.begin(), projected_.end());
  }
}

std::string ParquetTableReader::require(
    std::initializer_list<const char*> names, ColumnKind kind) {
  for (const char* name : names) {
    const int idx = schema_->GetFieldIndex(name);
    if (idx < 0) continue;

    const auto& type = *schema_->field(idx)->type();
    if (!accepts(type, kind)) {
      throw SchemaViolation(
          table_, name,
          "table '" + table_ + "' (" + path_ + "): column '" + name +
              "' has type " + type.ToString() + ", expected " +
              KindName(kind));
    }
    project(idx);
    return name;
  }

  const std::string wanted = *names.begin();
  throw SchemaViolation(table_, wanted,
                        "table '" + table_ + "' (" + path_ +
                            "): missing required column '" + wanted + "'");
}

std::string ParquetTableReader::optional(const char* name, ColumnKind kind) {
  const int idx = schema_->GetFieldIndex(name);
  if (idx < 0 || !accepts(*schema_->field(idx)->type(), kind)) return "";
  project(idx);
  return name;
}

int64_t ParquetTableReader::num_rows() const {
  return reader_->parquet_reader()->metadata()->num_rows();
}

std::shared_ptr<arrow::Array> ParquetTableReader::column(
    const arrow::RecordBatch& batch, const std::string& name) const {
  auto arr = batch.GetColumnByName(name);
  if (!arr) {
    throw SchemaViolation(table_, name,
                          "table '" + table_ + "': batch missing column '" +
                              name + "'");
  }
  return arr;
}

void ParquetTableReader::for_each_batch(
    const std::function<void(const arrow::RecordBatch&)>& fn) {
  // Build a RecordBatchReader over all row groups + projected columns
  const int nrg = reader_->parquet_reader()->metadata()->num_row_groups();
  std::vector<int> all_row_groups(static_cast<std::size_t>(nrg));
  std::iota(all_row_groups.begin(), all_row_groups.end(), 0);

  auto rb_res = reader_->GetRecordBatchReader(all_row_groups, projected_);
  if (!rb_res.ok()) {
    throw std::runtime_error("GetRecordBatchReader failed for " + table_ +
                             ": " + rb_res.status().ToString());
  }
  std::unique_ptr<arrow::RecordBatchReader> rb_reader =
      std::move(rb_res).ValueOrDie();

  while (true) {
    std::shared_ptr<arrow::RecordBatch> batch;
    auto st = rb_reader->ReadNext(&batch);
    if (!st.ok()) {
      throw std::runtime_error("ReadNext failed for " + table_ + ": " +
                               st.ToString());
    }

    // EOF
    if (!batch) break;

    if (batch->num_rows() == 0) continue;
    fn(*batch);
  }
}

// ------------------------- RawStoryTable -------------------------

RawStoryTable::RawStoryTable(const std::string& path,
                             const std::chrono::time_zone* origin)
    : reader_(path, "raw_stories"), origin_(origin) {
  if (!origin_) {
    throw std::invalid_argument("RawStoryTable: origin timezone is required");
  }
  id_col_ = reader_.require({"story_id", "rp_story_id"}, ColumnKind::String);
  ticker_col_ = reader_.require({"ticker"}, ColumnKind::String);
  ts_col_ = reader_.require({"timestamp_utc", "timestamp"},
                            ColumnKind::Timestamp);
}

std::vector<RawStory> RawStoryTable::load() {
  std::vector<RawStory> out;
  out.reserve(static_cast<std::size_t>(reader_.num_rows()));

  reader_.for_each_batch([&](const arrow::RecordBatch& batch) {
    auto id_arr = reader_.column(batch, id_col_);
    auto ticker_arr = reader_.column(batch, ticker_col_);
    auto ts_arr = reader_.column(batch, ts_col_);

    for (int64_t i = 0; i < batch.num_rows(); ++i) {
      if (ticker_arr->IsNull(i) ||
          ValueAt<std::string>(ticker_arr, i).empty()) {
        ++skipped_no_ticker_;
        continue;
      }
      if (ts_arr->IsNull(i) || id_arr->IsNull(i)) {
        ++skipped_no_timestamp_;
        continue;
      }

      const TimestampCell cell = TimestampAt(ts_arr, i);
      RawStory s;
      s.story_id = ValueAt<std::string>(id_arr, i);
      s.ticker = ValueAt<std::string>(ticker_arr, i);
      s.timestamp = cell.zoned
                        ? TimePointMs{cell.value}
                        : TradingCalendar::to_sys(LocalTimeMs{cell.value},
                                                  origin_);
      out.push_back(std::move(s));
    }
  });
  return out;
}

// ------------------------- LabelTable -------------------------

LabelTable::LabelTable(const std::string& path) : reader_(path, "labels") {
  id_col_ = reader_.require({"story_id", "rp_story_id"}, ColumnKind::String);
  ticker_col_ = reader_.require({"ticker"}, ColumnKind::String);
  label_col_ = reader_.require({"label"}, ColumnKind::String);
  score_col_ = reader_.require({"score"}, ColumnKind::Number);
  headline_col_ = reader_.require({"headline"}, ColumnKind::String);
}

std::vector<LabelRow> LabelTable::load() {
  std::vector<LabelRow> out;
  out.reserve(static_cast<std::size_t>(reader_.num_rows()));

  reader_.for_each_batch([&](const arrow::RecordBatch& batch) {
    auto id_arr = reader_.column(batch, id_col_);
    auto ticker_arr = reader_.column(batch, ticker_col_);
    auto label_arr = reader_.column(batch, label_col_);
    auto score_arr = reader_.column(batch, score_col_);
    auto headline_arr = reader_.column(batch, headline_col_);

    for (int64_t i = 0; i < batch.num_rows(); ++i) {
      LabelRow r;
      r.story_id = OptionalAt<std::string>(id_arr, i).value_or("");
      r.ticker = OptionalAt<std::string>(ticker_arr, i).value_or("");
      r.label_text = OptionalAt<std::string>(label_arr, i).value_or("");
      r.label = ParseSentimentLabel(r.label_text);
      r.score = OptionalAt<double>(score_arr, i);
      r.headline = OptionalAt<std::string>(headline_arr, i).value_or("");
      out.push_back(std::move(r));
    }
  });
  return out;
}

// ------------------------- StoryIndexTable -------------------------

StoryIndexTable::StoryIndexTable(const std::string& path,
                                 const TradingCalendar& calendar,
                                 const std::chrono::time_zone* origin)
    : reader_(path, "story_index"), calendar_(calendar), origin_(origin) {
  RequireOrigin(origin_, "story_index");
  id_col_ = reader_.require({"story_id", "rp_story_id"}, ColumnKind::String);
  ticker_col_ = reader_.require({"ticker"}, ColumnKind::String);
  date_col_ = reader_.require({"date"}, ColumnKind::Day);
  intraday_col_ = reader_.require({"is_intraday"}, ColumnKind::Bool);
  target_col_ = reader_.require({"target_minute", "t15"},
                                ColumnKind::Timestamp);
}

std::vector<StoryIndexRow> StoryIndexTable::load() {
  std::vector<StoryIndexRow> out;
  out.reserve(static_cast<std::size_t>(reader_.num_rows()));

  reader_.for_each_batch([&](const arrow::RecordBatch& batch) {
    auto id_arr = reader_.column(batch, id_col_);
    auto ticker_arr = reader_.column(batch, ticker_col_);
    auto date_arr = reader_.column(batch, date_col_);
    auto intraday_arr = reader_.column(batch, intraday_col_);
    auto target_arr = reader_.column(batch, target_col_);

    for (int64_t i = 0; i < batch.num_rows(); ++i) {
      // Without a key or a date the row can never join.
      if (id_arr->IsNull(i) || ticker_arr->IsNull(i) || date_arr->IsNull(i)) {
        ++dropped_null_key_;
        continue;
      }

      StoryIndexRow r;
      r.story_id = ValueAt<std::string>(id_arr, i);
      r.ticker = ValueAt<std::string>(ticker_arr, i);
      r.date = DayAt(date_arr, i);
      r.is_intraday = OptionalAt<bool>(intraday_arr, i).value_or(false);
      if (!target_arr->IsNull(i)) {
        r.target_minute =
            minute_of_day(LocalReading(TimestampAt(target_arr, i), calendar_,
                                       origin_));
      }
      out.push_back(std::move(r));
    }
  });
  return out;
}

// ------------------------- MinuteQuoteTable -------------------------

MinuteQuoteTable::MinuteQuoteTable(const std::string& path,
                                   const TradingCalendar& calendar,
                                   const std::chrono::time_zone* origin)
    : reader_(path, "minute_quotes"), calendar_(calendar), origin_(origin) {
  RequireOrigin(origin_, "minute_quotes");
  date_col_ = reader_.require({"date"}, ColumnKind::Day);
  minute_col_ = reader_.require({"minute_ts", "minute"},
                                ColumnKind::Timestamp);
  mid_col_ = reader_.require({"mid"}, ColumnKind::Number);

  // Either a canonical ticker, or the TAQ root/suffix pair to build one.
  ticker_col_ = reader_.optional("ticker", ColumnKind::String);
  if (ticker_col_.empty()) {
    root_col_ = reader_.optional("sym_root", ColumnKind::String);
    if (root_col_.empty()) {
      throw SchemaViolation("minute_quotes", "ticker",
                            "table 'minute_quotes' (" + path +
                                "): missing required column 'ticker' "
                                "(or 'sym_root')");
    }
    suffix_col_ = reader_.optional("sym_suffix", ColumnKind::String);
  }
}

std::vector<MinuteQuoteRow> MinuteQuoteTable::load() {
  std::vector<MinuteQuoteRow> out;
  out.reserve(static_cast<std::size_t>(reader_.num_rows()));

  reader_.for_each_batch([&](const arrow::RecordBatch& batch) {
    auto date_arr = reader_.column(batch, date_col_);
    auto minute_arr = reader_.column(batch, minute_col_);
    auto mid_arr = reader_.column(batch, mid_col_);
    std::shared_ptr<arrow::Array> ticker_arr, root_arr, suffix_arr;
    if (!ticker_col_.empty()) {
      ticker_arr = reader_.column(batch, ticker_col_);
    } else {
      root_arr = reader_.column(batch, root_col_);
      if (!suffix_col_.empty()) suffix_arr = reader_.column(batch, suffix_col_);
    }

    for (int64_t i = 0; i < batch.num_rows(); ++i) {
      if (mid_arr->IsNull(i)) {
        ++dropped_null_mid_;
        continue;
      }
      if (date_arr->IsNull(i) || minute_arr->IsNull(i)) {
        ++dropped_null_key_;
        continue;
      }

      MinuteQuoteRow r;
      if (ticker_arr) {
        if (ticker_arr->IsNull(i)) {
          ++dropped_null_key_;
          continue;
        }
        r.ticker = ValueAt<std::string>(ticker_arr, i);
      } else {
        if (root_arr->IsNull(i)) {
          ++dropped_null_key_;
          continue;
        }
        std::string suffix;
        if (suffix_arr) {
          suffix = OptionalAt<std::string>(suffix_arr, i).value_or("");
        }
        r.ticker = CanonicalTicker(ValueAt<std::string>(root_arr, i), suffix);
      }
      r.date = DayAt(date_arr, i);
      r.minute_of_day =
          minute_of_day(LocalReading(TimestampAt(minute_arr, i), calendar_,
                                     origin_));
      r.mid = ValueAt<double>(mid_arr, i);
      out.push_back(std::move(r));
    }
  });
  return out;
}

// ------------------------- DailyPriceTable -------------------------

DailyPriceTable::DailyPriceTable(const std::string& path)
    : reader_(path, "daily_prices") {
  date_col_ = reader_.require({"date"}, ColumnKind::Day);
  ticker_col_ = reader_.require({"ticker"}, ColumnKind::String);
  open_col_ = reader_.require({"open", "openprc"}, ColumnKind::Number);
  close_col_ = reader_.require({"close", "closeprc"}, ColumnKind::Number);
}

std::vector<DailyPriceRow> DailyPriceTable::load() {
  std::vector<DailyPriceRow> out;
  out.reserve(static_cast<std::size_t>(reader_.num_rows()));

  reader_.for_each_batch([&](const arrow::RecordBatch& batch) {
    auto date_arr = reader_.column(batch, date_col_);
    auto ticker_arr = reader_.column(batch, ticker_col_);
    auto open_arr = reader_.column(batch, open_col_);
    auto close_arr = reader_.column(batch, close_col_);

    for (int64_t i = 0; i < batch.num_rows(); ++i) {
      if (date_arr->IsNull(i) || ticker_arr->IsNull(i)) {
        ++dropped_null_key_;
        continue;
      }

      DailyPriceRow r;
      r.date = DayAt(date_arr, i);
      r.ticker = ValueAt<std::string>(ticker_arr, i);
      r.open = OptionalAt<double>(open_arr, i);
      r.close = OptionalAt<double>(close_arr, i);
      out.push_back(std::move(r));
    }
  });
  return out;
}

// ------------------------- Portfolio table -------------------------

std::vector<PortfolioDay> ReadPortfolioDays(const std::string& path) {
  ParquetTableReader reader(path, "portfolio_daily");
  const std::string date_col = reader.require({"date"}, ColumnKind::Day);
  const std::string npos_col =
      reader.require({"n_positive"}, ColumnKind::Integer);
  const std::string nneg_col =
      reader.require({"n_negative"}, ColumnKind::Integer);
  const std::string nneu_col =
      reader.require({"n_neutral"}, ColumnKind::Integer);

  const char* const kValueCols[] = {
      "ir_long_only",    "ir_short_only",    "ir_long_short",
      "drift_long_only", "drift_short_only", "drift_long_short"};
  for (const char* c : kValueCols) reader.require({c}, ColumnKind::Number);

  std::vector<PortfolioDay> out;
  reader.for_each_batch([&](const arrow::RecordBatch& batch) {
    auto date_arr = reader.column(batch, date_col);
    auto npos_arr = reader.column(batch, npos_col);
    auto nneg_arr = reader.column(batch, nneg_col);
    auto nneu_arr = reader.column(batch, nneu_col);
    std::shared_ptr<arrow::Array> v[6];
    for (int k = 0; k < 6; ++k) v[k] = reader.column(batch, kValueCols[k]);

    for (int64_t i = 0; i < batch.num_rows(); ++i) {
      if (date_arr->IsNull(i)) continue;
      PortfolioDay d;
      d.date = DayAt(date_arr, i);
      d.n_positive = static_cast<uint32_t>(
          OptionalAt<uint64_t>(npos_arr, i).value_or(0));
      d.n_negative = static_cast<uint32_t>(
          OptionalAt<uint64_t>(nneg_arr, i).value_or(0));
      d.n_neutral = static_cast<uint32_t>(
          OptionalAt<uint64_t>(nneu_arr, i).value_or(0));
      d.ir_long_only = OptionalAt<double>(v[0], i);
      d.ir_short_only = OptionalAt<double>(v[1], i);
      d.ir_long_short = OptionalAt<double>(v[2], i);
      d.drift_long_only = OptionalAt<double>(v[3], i);
      d.drift_short_only = OptionalAt<double>(v[4], i);
      d.drift_long_short = OptionalAt<double>(v[5], i);
      out.push_back(d);
    }
  });
  return out;
}

}  // namespace newsret
