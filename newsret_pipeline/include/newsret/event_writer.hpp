#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "newsret/event_types.hpp"
#include "newsret/time_utils.hpp"

namespace newsret {

// Buffers rows in Arrow builders and writes them to a Parquet file one
// RecordBatch at a time. Subclasses own the builders; close() must be called
// to flush the tail and finalize the file.
class TableWriter {
 public:
  TableWriter(const std::string& out_path,
              std::shared_ptr<arrow::Schema> schema);
  virtual ~TableWriter() = default;

  TableWriter(const TableWriter&) = delete;
  TableWriter& operator=(const TableWriter&) = delete;

  void close();

  uint64_t total_rows() const { return total_rows_; }

 protected:
  // Call after appending one value to every builder.
  void row_appended();

  // Finish every builder in schema order. Finish() leaves builders empty.
  virtual std::vector<std::shared_ptr<arrow::Array>> finish_columns() = 0;

 private:
  void flush_batch();

  // Flush interval
  static constexpr int64_t BATCH = 1'000'000;

  std::shared_ptr<arrow::Schema> schema_;
  std::unique_ptr<parquet::arrow::FileWriter> writer_;
  int64_t batch_rows_ = 0;
  uint64_t total_rows_ = 0;
  bool closed_ = false;
};

// Story index rows (build_story_index output).
class StoryIndexWriter final : public TableWriter {
 public:
  StoryIndexWriter(const std::string& out_path, const std::string& local_tz);

  void append(const StoryIndexRow& row,
              std::optional<TimePointMs> target_instant);

 protected:
  std::vector<std::shared_ptr<arrow::Array>> finish_columns() override;

 private:
  arrow::StringBuilder idb_, tickerb_;
  arrow::UInt32Builder dateb_;
  arrow::BooleanBuilder intradayb_;
  arrow::TimestampBuilder targetb_;
};

class EventReturnWriter final : public TableWriter {
 public:
  explicit EventReturnWriter(const std::string& out_path);

  void append(const EventReturn& ev);

 protected:
  std::vector<std::shared_ptr<arrow::Array>> finish_columns() override;

 private:
  arrow::StringBuilder idb_, tickerb_, headlineb_, labelb_;
  arrow::UInt32Builder dateb_;
  arrow::BooleanBuilder intradayb_;
  arrow::DoubleBuilder scoreb_, openb_, closeb_, prevb_, nextb_, midb_, irb_,
      driftb_;
  arrow::StringBuilder ir_statusb_, drift_statusb_;
};

class FirmDayWriter final : public TableWriter {
 public:
  explicit FirmDayWriter(const std::string& out_path);

  void append(const FirmDay& fd);

 protected:
  std::vector<std::shared_ptr<arrow::Array>> finish_columns() override;

 private:
  arrow::UInt32Builder dateb_;
  arrow::StringBuilder tickerb_;
  arrow::DoubleBuilder scoreb_;
  arrow::UInt32Builder nb_;
  arrow::DoubleBuilder irb_, driftb_;
  arrow::StringBuilder sentimentb_;
};

class PortfolioWriter final : public TableWriter {
 public:
  explicit PortfolioWriter(const std::string& out_path);

  void append(const PortfolioDay& day);

 protected:
  std::vector<std::shared_ptr<arrow::Array>> finish_columns() override;

 private:
  arrow::UInt32Builder dateb_, nposb_, nnegb_, nneub_;
  arrow::DoubleBuilder ir_longb_, ir_shortb_, ir_lsb_, dr_longb_, dr_shortb_,
      dr_lsb_;
};

}  // namespace newsret
