#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace newsret {

// Categorical label attached to a story by the upstream labeler.
enum class SentimentLabel { Positive, Negative, Unknown };

// Firm-day classification derived from the aggregated score.
enum class Sentiment { Positive, Negative, Neutral };

// Why a per-story return is (or is not) populated.
enum class ReturnStatus : uint8_t {
  kOk = 0,
  kMissingPrice,     // no daily price row, or a needed price is null
  kMissingQuote,     // intraday story without a t+15 minute quote
  kZeroDenominator,  // prev_close / open / close is zero
};

// One row of the labeled-stories table.
struct LabelRow {
  std::string story_id;
  std::string ticker;
  std::string headline;
  std::string label_text;        // label as emitted upstream
  SentimentLabel label = SentimentLabel::Unknown;
  std::optional<double> score;   // in [0, 1]
};

// One row of the intraday story index.
struct StoryIndexRow {
  std::string story_id;
  std::string ticker;
  uint32_t date = 0;                  // trading date, YYYYMMDD
  bool is_intraday = false;
  std::optional<int> target_minute;   // local minute-of-day of t+15
};

// A labeled story joined with its index row; input to the event-return
// calculation.
struct Story {
  std::string story_id;
  std::string ticker;
  std::string headline;
  std::string label_text;
  SentimentLabel label = SentimentLabel::Unknown;
  std::optional<double> score;

  uint32_t date = 0;
  bool is_intraday = false;
  std::optional<int> target_minute;
};

// Same-day and neighbouring prices for one (ticker, date).
struct PriceRecord {
  std::optional<double> open;
  std::optional<double> close;
  std::optional<double> prev_close;
  std::optional<double> next_close;
};

// One row per story with the joined prices and computed returns.
struct EventReturn {
  Story story;

  bool price_found = false;
  PriceRecord price;               // all null when !price_found
  std::optional<double> mid_t15;   // intraday only

  std::optional<double> initial_reaction;
  std::optional<double> drift;
  ReturnStatus initial_reaction_status = ReturnStatus::kOk;
  ReturnStatus drift_status = ReturnStatus::kOk;
};

// All stories of one ticker on one trading date.
struct FirmDay {
  std::string ticker;
  uint32_t date = 0;
  std::optional<double> avg_score;
  uint32_t n_stories = 0;
  std::optional<double> initial_reaction;
  std::optional<double> drift;
  Sentiment sentiment = Sentiment::Neutral;
};

// Daily long/short portfolio returns. Short-only values are sign-flipped so
// that a positive number means the short book gained.
struct PortfolioDay {
  uint32_t date = 0;
  uint32_t n_positive = 0;
  uint32_t n_negative = 0;
  uint32_t n_neutral = 0;

  std::optional<double> ir_long_only;
  std::optional<double> ir_short_only;
  std::optional<double> ir_long_short;

  std::optional<double> drift_long_only;
  std::optional<double> drift_short_only;
  std::optional<double> drift_long_short;
};

const char* to_string(SentimentLabel label);
const char* to_string(Sentiment sentiment);
const char* to_string(ReturnStatus status);

}  // namespace newsret
