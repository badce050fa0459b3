#pragma once

#include <optional>
#include <string_view>

#include "newsret/event_types.hpp"

namespace newsret {

// Firm-day scores strictly above this are positive, strictly below negative.
inline constexpr double kNeutralScore = 0.5;

// Maps an upstream label to SentimentLabel. Accepts both the
// positive/negative/unknown and the YES/NO/UNKNOWN vocabularies,
// case-insensitive, on the first whitespace-delimited token.
SentimentLabel ParseSentimentLabel(std::string_view text);

// Thresholds an aggregated score. A null score is neutral.
Sentiment ClassifySentiment(std::optional<double> avg_score);

}  // namespace newsret
