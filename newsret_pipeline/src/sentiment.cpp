#include "newsret/sentiment.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace newsret {

SentimentLabel ParseSentimentLabel(std::string_view text) {
  // First token only: labelers sometimes append an explanation.
  auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  auto begin = std::find_if_not(text.begin(), text.end(), is_space);
  auto end = std::find_if(begin, text.end(), is_space);

  std::string token(begin, end);
  std::transform(token.begin(), token.end(), token.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });

  if (token == "YES" || token == "POSITIVE") return SentimentLabel::Positive;
  if (token == "NO" || token == "NEGATIVE") return SentimentLabel::Negative;
  return SentimentLabel::Unknown;
}

Sentiment ClassifySentiment(std::optional<double> avg_score) {
  if (!avg_score) return Sentiment::Neutral;
  if (*avg_score > kNeutralScore) return Sentiment::Positive;
  if (*avg_score < kNeutralScore) return Sentiment::Negative;
  return Sentiment::Neutral;
}

}  // namespace newsret
