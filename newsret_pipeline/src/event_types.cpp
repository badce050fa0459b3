#include "newsret/event_types.hpp"

namespace newsret {

const char* to_string(SentimentLabel label) {
  switch (label) {
    case SentimentLabel::Positive:
      return "positive";
    case SentimentLabel::Negative:
      return "negative";
    case SentimentLabel::Unknown:
      return "unknown";
  }
  return "unknown";
}

const char* to_string(Sentiment sentiment) {
  switch (sentiment) {
    case Sentiment::Positive:
      return "positive";
    case Sentiment::Negative:
      return "negative";
    case Sentiment::Neutral:
      return "neutral";
  }
  return "neutral";
}

const char* to_string(ReturnStatus status) {
  switch (status) {
    case ReturnStatus::kOk:
      return "ok";
    case ReturnStatus::kMissingPrice:
      return "missing_price";
    case ReturnStatus::kMissingQuote:
      return "missing_quote";
    case ReturnStatus::kZeroDenominator:
      return "zero_denominator";
  }
  return "ok";
}

}  // namespace newsret
