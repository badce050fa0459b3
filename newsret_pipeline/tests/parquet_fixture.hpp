#pragma once

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "newsret/arrow_utils.hpp"

namespace newsret::test {

// Column-at-a-time builder for small Parquet inputs in tests.
class ParquetFixture {
 public:
  ParquetFixture& strings(const std::string& name,
                          const std::vector<std::optional<std::string>>& v) {
    arrow::StringBuilder b;
    for (const auto& x : v) ARROW_OK(x ? b.Append(*x) : b.AppendNull());
    return add(arrow::field(name, arrow::utf8()), b);
  }

  ParquetFixture& doubles(const std::string& name,
                          const std::vector<std::optional<double>>& v) {
    arrow::DoubleBuilder b;
    for (const auto& x : v) ARROW_OK(x ? b.Append(*x) : b.AppendNull());
    return add(arrow::field(name, arrow::float64()), b);
  }

  ParquetFixture& int64s(const std::string& name,
                         const std::vector<std::optional<int64_t>>& v) {
    arrow::Int64Builder b;
    for (const auto& x : v) ARROW_OK(x ? b.Append(*x) : b.AppendNull());
    return add(arrow::field(name, arrow::int64()), b);
  }

  ParquetFixture& bools(const std::string& name, const std::vector<bool>& v) {
    arrow::BooleanBuilder b;
    for (bool x : v) ARROW_OK(b.Append(x));
    return add(arrow::field(name, arrow::boolean()), b);
  }

  // Days since 1970-01-01.
  ParquetFixture& date32s(const std::string& name,
                          const std::vector<int32_t>& v) {
    arrow::Date32Builder b;
    for (int32_t x : v) ARROW_OK(b.Append(x));
    return add(arrow::field(name, arrow::date32()), b);
  }

  // Epoch milliseconds; tz "" writes a naive timestamp column.
  ParquetFixture& timestamps(const std::string& name,
                             const std::vector<std::optional<int64_t>>& v,
                             const std::string& tz) {
    auto type = arrow::timestamp(arrow::TimeUnit::MILLI, tz);
    arrow::TimestampBuilder b(type, arrow::default_memory_pool());
    for (const auto& x : v) ARROW_OK(x ? b.Append(*x) : b.AppendNull());
    return add(arrow::field(name, type), b);
  }

  void write(const std::string& path) const {
    std::filesystem::create_directories(
        std::filesystem::path(path).parent_path());
    auto table = arrow::Table::Make(arrow::schema(fields_), columns_);
    auto out = arrow::io::FileOutputStream::Open(path);
    ARROW_OK(out.status());
    ARROW_OK(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(),
                                        *out, 1024));
    ARROW_OK((*out)->Close());
  }

 private:
  ParquetFixture& add(std::shared_ptr<arrow::Field> field,
                      arrow::ArrayBuilder& b) {
    std::shared_ptr<arrow::Array> arr;
    ARROW_OK(b.Finish(&arr));
    fields_.push_back(std::move(field));
    columns_.push_back(std::move(arr));
    return *this;
  }

  std::vector<std::shared_ptr<arrow::Field>> fields_;
  std::vector<std::shared_ptr<arrow::Array>> columns_;
};

// Fresh scratch directory under the system temp dir, removed on destruction.
class ScratchDir {
 public:
  explicit ScratchDir(const std::string& name)
      : path_(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::string file(const std::string& name) const {
    return (path_ / name).string();
  }
  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace newsret::test
