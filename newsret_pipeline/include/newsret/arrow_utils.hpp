#pragma once
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "newsret/time_utils.hpp"

namespace newsret {

// A required input column is absent or has an unusable type. Always fatal:
// raised before any row is processed.
class SchemaViolation : public std::runtime_error {
 public:
  SchemaViolation(std::string table, std::string column,
                  const std::string& what)
      : std::runtime_error(what),
        table_(std::move(table)),
        column_(std::move(column)) {}

  const std::string& table() const { return table_; }
  const std::string& column() const { return column_; }

 private:
  std::string table_;
  std::string column_;
};

// Generic declaration for typed value extraction from Arrow arrays
template <typename T>
T ValueAt(const std::shared_ptr<arrow::Array>& arr, int64_t i);

// Specialization for extracting unsigned integers as uint64_t
template <>
inline uint64_t ValueAt<uint64_t>(const std::shared_ptr<arrow::Array>& arr,
                                  int64_t i) {
  switch (arr->type_id()) {
    case arrow::Type::UINT64:
      return static_cast<const arrow::UInt64Array&>(*arr).Value(i);
    case arrow::Type::INT64:
      return static_cast<uint64_t>(
          static_cast<const arrow::Int64Array&>(*arr).Value(i));
    case arrow::Type::UINT32:
      return static_cast<const arrow::UInt32Array&>(*arr).Value(i);
    case arrow::Type::INT32:
      return static_cast<uint64_t>(
          static_cast<const arrow::Int32Array&>(*arr).Value(i));
    default:
      throw std::runtime_error("Unsupported type: " + arr->type()->ToString());
  }
}

// Specialization for extracting numeric columns as double. Integer price
// columns are widened.
template <>
inline double ValueAt<double>(const std::shared_ptr<arrow::Array>& arr,
                              int64_t i) {
  switch (arr->type_id()) {
    case arrow::Type::FLOAT:
      return static_cast<double>(
          static_cast<const arrow::FloatArray&>(*arr).Value(i));
    case arrow::Type::DOUBLE:
      return static_cast<const arrow::DoubleArray&>(*arr).Value(i);
    case arrow::Type::INT32:
      return static_cast<double>(
          static_cast<const arrow::Int32Array&>(*arr).Value(i));
    case arrow::Type::INT64:
      return static_cast<double>(
          static_cast<const arrow::Int64Array&>(*arr).Value(i));
    default:
      throw std::runtime_error("Unsupported type: " + arr->type()->ToString());
  }
}

// Specialization for utf8 / large_utf8 columns
template <>
inline std::string ValueAt<std::string>(
    const std::shared_ptr<arrow::Array>& arr, int64_t i) {
  switch (arr->type_id()) {
    case arrow::Type::STRING:
      return static_cast<const arrow::StringArray&>(*arr).GetString(i);
    case arrow::Type::LARGE_STRING:
      return static_cast<const arrow::LargeStringArray&>(*arr).GetString(i);
    default:
      throw std::runtime_error("Unsupported type: " + arr->type()->ToString());
  }
}

template <>
inline bool ValueAt<bool>(const std::shared_ptr<arrow::Array>& arr,
                          int64_t i) {
  switch (arr->type_id()) {
    case arrow::Type::BOOL:
      return static_cast<const arrow::BooleanArray&>(*arr).Value(i);
    case arrow::Type::INT8:
      return static_cast<const arrow::Int8Array&>(*arr).Value(i) != 0;
    default:
      throw std::runtime_error("Unsupported type: " + arr->type()->ToString());
  }
}

// Nullable variant: std::nullopt for a null slot.
template <typename T>
inline std::optional<T> OptionalAt(const std::shared_ptr<arrow::Array>& arr,
                                   int64_t i) {
  if (arr->IsNull(i)) return std::nullopt;
  return ValueAt<T>(arr, i);
}

// Raw timestamp cell. `zoned` is true when the column type carries a
// timezone, in which case `value` is an instant since the Unix epoch (UTC);
// otherwise it is a naive wall-clock reading encoded the same way.
struct TimestampCell {
  std::chrono::milliseconds value{0};
  bool zoned = false;
};

inline TimestampCell TimestampAt(const std::shared_ptr<arrow::Array>& arr,
                                 int64_t i) {
  using namespace std::chrono;
  if (arr->type_id() != arrow::Type::TIMESTAMP) {
    throw std::runtime_error("Unsupported type: " + arr->type()->ToString());
  }
  const auto& ts_type =
      static_cast<const arrow::TimestampType&>(*arr->type());
  const int64_t raw = static_cast<const arrow::TimestampArray&>(*arr).Value(i);

  TimestampCell cell;
  cell.zoned = !ts_type.timezone().empty();
  switch (ts_type.unit()) {
    case arrow::TimeUnit::SECOND:
      cell.value = seconds{raw};
      break;
    case arrow::TimeUnit::MILLI:
      cell.value = milliseconds{raw};
      break;
    case arrow::TimeUnit::MICRO:
      cell.value = floor<milliseconds>(microseconds{raw});
      break;
    case arrow::TimeUnit::NANO:
      cell.value = floor<milliseconds>(nanoseconds{raw});
      break;
  }
  return cell;
}

// Trading-day cell as YYYYMMDD. Accepts date32, date64, integer YYYYMMDD,
// and timestamps (date part of the stored value).
inline uint32_t DayAt(const std::shared_ptr<arrow::Array>& arr, int64_t i) {
  using namespace std::chrono;
  switch (arr->type_id()) {
    case arrow::Type::DATE32:
      return epoch_days_to_day(
          static_cast<const arrow::Date32Array&>(*arr).Value(i));
    case arrow::Type::DATE64:
      return sys_day(sys_time<milliseconds>{milliseconds{
          static_cast<const arrow::Date64Array&>(*arr).Value(i)}});
    case arrow::Type::UINT32:
    case arrow::Type::INT32:
    case arrow::Type::INT64:
    case arrow::Type::UINT64:
      return static_cast<uint32_t>(ValueAt<uint64_t>(arr, i));
    case arrow::Type::TIMESTAMP:
      return sys_day(sys_time<milliseconds>{TimestampAt(arr, i).value});
    default:
      throw std::runtime_error("Unsupported type: " + arr->type()->ToString());
  }
}

inline std::unique_ptr<parquet::arrow::FileReader> open_parquet_reader(
    const std::string& path, std::shared_ptr<arrow::Schema>& out_schema) {
  // Open a Parquet file and return a FileReader

  // Open file
  auto readable_file_result = arrow::io::ReadableFile::Open(path);
  if (!readable_file_result.ok()) {
    throw std::runtime_error("open input failed: " + path + ": " +
                             readable_file_result.status().ToString());
  }

  // Open file via parquet reader
  auto parquet_read_result = parquet::arrow::OpenFile(
      *readable_file_result, arrow::default_memory_pool());
  if (!parquet_read_result.ok()) {
    throw std::runtime_error("open parquet reader failed: " + path + ": " +
                             parquet_read_result.status().ToString());
  }

  // Validate schema then return reader
  auto reader = std::move(parquet_read_result).ValueOrDie();
  auto st = reader->GetSchema(&out_schema);
  if (!st.ok()) {
    throw std::runtime_error("get schema failed: " + st.ToString());
  }
  return reader;
}

// helper used at runtime for validation
static inline void ARROW_OK(const arrow::Status& st) {
  if (!st.ok()) throw std::runtime_error(st.ToString());
}

}  // namespace newsret
