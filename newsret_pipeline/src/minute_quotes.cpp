#include "newsret/minute_quotes.hpp"

#include <utility>

namespace newsret {

std::string CanonicalTicker(std::string_view sym_root,
                            std::string_view sym_suffix) {
  std::string t(sym_root);
  if (!sym_suffix.empty()) t.append(sym_suffix);
  return t;
}

MinuteQuoteIndex::MinuteQuoteIndex(std::vector<MinuteQuoteRow> rows) {
  mids_.reserve(rows.size());
  for (auto& r : rows) {
    // The panel carries one mid per minute; a repeated key keeps the first.
    auto [it, inserted] = mids_.try_emplace(
        Key{std::move(r.ticker), r.date, r.minute_of_day}, r.mid);
    (void)it;
    if (!inserted) ++duplicates_dropped_;
  }
}

std::optional<double> MinuteQuoteIndex::lookup_mid(const std::string& ticker,
                                                   uint32_t date,
                                                   int minute_of_day) const {
  auto it = mids_.find(Key{ticker, date, minute_of_day});
  if (it == mids_.end()) return std::nullopt;
  return it->second;
}

}  // namespace newsret
