#include "newsret/firm_day.hpp"

#include <map>
#include <string>
#include <utility>

#include "newsret/sentiment.hpp"

namespace newsret {

namespace {

// Running mean over non-null values.
struct NullableMean {
  double sum = 0.0;
  uint32_t n = 0;

  void add(const std::optional<double>& v) {
    if (!v) return;
    sum += *v;
    ++n;
  }
  std::optional<double> value() const {
    if (n == 0) return std::nullopt;
    return sum / static_cast<double>(n);
  }
};

struct FirmDayAccumulator {
  uint32_t n_stories = 0;
  NullableMean score;
  NullableMean initial_reaction;
  NullableMean drift;
};

}  // namespace

std::vector<FirmDay> AggregateFirmDays(const std::vector<EventReturn>& events) {
  // Ordered map gives (date, ticker) output order for free.
  std::map<std::pair<uint32_t, std::string>, FirmDayAccumulator> groups;

  for (const auto& ev : events) {
    auto& acc = groups[{ev.story.date, ev.story.ticker}];
    ++acc.n_stories;
    acc.score.add(ev.story.score);
    acc.initial_reaction.add(ev.initial_reaction);
    acc.drift.add(ev.drift);
  }

  std::vector<FirmDay> out;
  out.reserve(groups.size());
  for (const auto& [key, acc] : groups) {
    FirmDay fd;
    fd.date = key.first;
    fd.ticker = key.second;
    fd.n_stories = acc.n_stories;
    fd.avg_score = acc.score.value();
    fd.initial_reaction = acc.initial_reaction.value();
    fd.drift = acc.drift.value();
    fd.sentiment = ClassifySentiment(fd.avg_score);
    out.push_back(std::move(fd));
  }
  return out;
}

}  // namespace newsret
