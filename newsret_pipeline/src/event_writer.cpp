#include "newsret/event_writer.hpp"

#include <filesystem>
#include <stdexcept>

#include "newsret/arrow_utils.hpp"
#include "newsret/schema.hpp"

namespace newsret {

namespace {

std::shared_ptr<arrow::Array> FinishArray(arrow::ArrayBuilder& b) {
  std::shared_ptr<arrow::Array> out;
  ARROW_OK(b.Finish(&out));
  return out;
}

void AppendOptional(arrow::DoubleBuilder& b, const std::optional<double>& v) {
  ARROW_OK(v ? b.Append(*v) : b.AppendNull());
}

}  // namespace

// ------------------------- TableWriter -------------------------

TableWriter::TableWriter(const std::string& out_path,
                         std::shared_ptr<arrow::Schema> schema)
    : schema_(std::move(schema)) {
  // Create parent directory of the output file
  std::filesystem::path p(out_path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("create output directory failed: " +
                               p.parent_path().string() + ": " + ec.message());
    }
  }

  // Open file output stream
  auto of_res = arrow::io::FileOutputStream::Open(out_path);
  if (!of_res.ok()) {
    throw std::runtime_error("open output failed: " + out_path + ": " +
                             of_res.status().ToString());
  }
  auto outfile = *of_res;

  // Create Parquet writer
  auto fw_res = parquet::arrow::FileWriter::Open(
      *schema_, arrow::default_memory_pool(), outfile);
  if (!fw_res.ok()) {
    throw std::runtime_error("create writer failed: " +
                             fw_res.status().ToString());
  }
  writer_ = std::move(fw_res).ValueOrDie();
}

void TableWriter::row_appended() {
  if (++batch_rows_ >= BATCH) {
    flush_batch();
  }
}

void TableWriter::close() {
  // Finalize file by:
  // - Flushing remaining buffered rows
  // - Closing the parquet writer
  if (closed_) return;
  flush_batch();
  if (writer_) {
    ARROW_OK(writer_->Close());
  }
  closed_ = true;
}

void TableWriter::flush_batch() {
  // Convert builders -> RecordBatch -> Parquet
  if (batch_rows_ == 0) return;

  auto batch = arrow::RecordBatch::Make(schema_, batch_rows_, finish_columns());
  ARROW_OK(writer_->WriteRecordBatch(*batch));
  total_rows_ += static_cast<uint64_t>(batch_rows_);
  batch_rows_ = 0;
}

// ------------------------- StoryIndexWriter -------------------------

StoryIndexWriter::StoryIndexWriter(const std::string& out_path,
                                   const std::string& local_tz)
    : TableWriter(out_path, story_index_schema(local_tz)),
      targetb_(arrow::timestamp(arrow::TimeUnit::MILLI, local_tz),
               arrow::default_memory_pool()) {}

void StoryIndexWriter::append(const StoryIndexRow& row,
                              std::optional<TimePointMs> target_instant) {
  ARROW_OK(idb_.Append(row.story_id));
  ARROW_OK(tickerb_.Append(row.ticker));
  ARROW_OK(dateb_.Append(row.date));
  ARROW_OK(intradayb_.Append(row.is_intraday));
  ARROW_OK(target_instant ? targetb_.Append(to_epoch_ms(*target_instant))
                          : targetb_.AppendNull());
  row_appended();
}

std::vector<std::shared_ptr<arrow::Array>> StoryIndexWriter::finish_columns() {
  return {FinishArray(idb_), FinishArray(tickerb_), FinishArray(dateb_),
          FinishArray(intradayb_), FinishArray(targetb_)};
}

// ------------------------- EventReturnWriter -------------------------

EventReturnWriter::EventReturnWriter(const std::string& out_path)
    : TableWriter(out_path, event_return_schema()) {}

void EventReturnWriter::append(const EventReturn& ev) {
  const Story& s = ev.story;
  ARROW_OK(idb_.Append(s.story_id));
  ARROW_OK(tickerb_.Append(s.ticker));
  ARROW_OK(dateb_.Append(s.date));
  ARROW_OK(intradayb_.Append(s.is_intraday));
  ARROW_OK(headlineb_.Append(s.headline));
  ARROW_OK(labelb_.Append(to_string(s.label)));
  AppendOptional(scoreb_, s.score);
  AppendOptional(openb_, ev.price.open);
  AppendOptional(closeb_, ev.price.close);
  AppendOptional(prevb_, ev.price.prev_close);
  AppendOptional(nextb_, ev.price.next_close);
  AppendOptional(midb_, ev.mid_t15);
  AppendOptional(irb_, ev.initial_reaction);
  AppendOptional(driftb_, ev.drift);
  ARROW_OK(ir_statusb_.Append(to_string(ev.initial_reaction_status)));
  ARROW_OK(drift_statusb_.Append(to_string(ev.drift_status)));
  row_appended();
}

std::vector<std::shared_ptr<arrow::Array>>
EventReturnWriter::finish_columns() {
  return {FinishArray(idb_),        FinishArray(tickerb_),
          FinishArray(dateb_),      FinishArray(intradayb_),
          FinishArray(headlineb_),  FinishArray(labelb_),
          FinishArray(scoreb_),     FinishArray(openb_),
          FinishArray(closeb_),     FinishArray(prevb_),
          FinishArray(nextb_),      FinishArray(midb_),
          FinishArray(irb_),        FinishArray(driftb_),
          FinishArray(ir_statusb_), FinishArray(drift_statusb_)};
}

// ------------------------- FirmDayWriter -------------------------

FirmDayWriter::FirmDayWriter(const std::string& out_path)
    : TableWriter(out_path, firm_day_schema()) {}

void FirmDayWriter::append(const FirmDay& fd) {
  ARROW_OK(dateb_.Append(fd.date));
  ARROW_OK(tickerb_.Append(fd.ticker));
  AppendOptional(scoreb_, fd.avg_score);
  ARROW_OK(nb_.Append(fd.n_stories));
  AppendOptional(irb_, fd.initial_reaction);
  AppendOptional(driftb_, fd.drift);
  ARROW_OK(sentimentb_.Append(to_string(fd.sentiment)));
  row_appended();
}

std::vector<std::shared_ptr<arrow::Array>> FirmDayWriter::finish_columns() {
  return {FinishArray(dateb_), FinishArray(tickerb_), FinishArray(scoreb_),
          FinishArray(nb_),    FinishArray(irb_),     FinishArray(driftb_),
          FinishArray(sentimentb_)};
}

// ------------------------- PortfolioWriter -------------------------

PortfolioWriter::PortfolioWriter(const std::string& out_path)
    : TableWriter(out_path, portfolio_schema()) {}

void PortfolioWriter::append(const PortfolioDay& day) {
  ARROW_OK(dateb_.Append(day.date));
  ARROW_OK(nposb_.Append(day.n_positive));
  ARROW_OK(nnegb_.Append(day.n_negative));
  ARROW_OK(nneub_.Append(day.n_neutral));
  AppendOptional(ir_longb_, day.ir_long_only);
  AppendOptional(ir_shortb_, day.ir_short_only);
  AppendOptional(ir_lsb_, day.ir_long_short);
  AppendOptional(dr_longb_, day.drift_long_only);
  AppendOptional(dr_shortb_, day.drift_short_only);
  AppendOptional(dr_lsb_, day.drift_long_short);
  row_appended();
}

std::vector<std::shared_ptr<arrow::Array>> PortfolioWriter::finish_columns() {
  return {FinishArray(dateb_),     FinishArray(nposb_),
          FinishArray(nnegb_),     FinishArray(nneub_),
          FinishArray(ir_longb_),  FinishArray(ir_shortb_),
          FinishArray(ir_lsb_),    FinishArray(dr_longb_),
          FinishArray(dr_shortb_), FinishArray(dr_lsb_)};
}

}  // namespace newsret
