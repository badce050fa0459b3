#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace newsret {

// One minute bucket of the quote panel: the mid price the upstream
// aggregator resolved for (ticker, date, minute).
struct MinuteQuoteRow {
  std::string ticker;
  uint32_t date = 0;       // YYYYMMDD
  int minute_of_day = 0;   // local minutes since midnight
  double mid = 0.0;
};

// Ticker for a quote row: root + suffix when the suffix is non-empty.
std::string CanonicalTicker(std::string_view sym_root,
                            std::string_view sym_suffix);

// Exact-key lookup of minute mids. There is no nearest-minute search: a
// target minute with no bucket is NotFound (std::nullopt).
class MinuteQuoteIndex {
 public:
  MinuteQuoteIndex() = default;
  explicit MinuteQuoteIndex(std::vector<MinuteQuoteRow> rows);

  std::optional<double> lookup_mid(const std::string& ticker, uint32_t date,
                                   int minute_of_day) const;

  std::size_t size() const { return mids_.size(); }
  std::size_t duplicates_dropped() const { return duplicates_dropped_; }

 private:
  struct Key {
    std::string ticker;
    uint32_t date;
    int minute;
    bool operator==(const Key&) const = default;
  };
  struct KeyHash {
    std::size_t operator()(const Key& k) const {
      std::size_t h = std::hash<std::string>{}(k.ticker);
      const uint64_t dm = (static_cast<uint64_t>(k.date) << 16) ^
                          static_cast<uint64_t>(k.minute);
      return h ^ (std::hash<uint64_t>{}(dm) + 0x9e3779b97f4a7c15ULL +
                  (h << 6) + (h >> 2));
    }
  };

  std::unordered_map<Key, double, KeyHash> mids_;
  std::size_t duplicates_dropped_ = 0;
};

}  // namespace newsret
