#pragma once
#include <arrow/api.h>

#include <memory>
#include <string>

namespace newsret {

// Output of build_story_index; input of run_event_study.
inline std::shared_ptr<arrow::Schema> story_index_schema(
    const std::string& local_tz) {
  return arrow::schema({
      arrow::field("story_id", arrow::utf8()),
      arrow::field("ticker", arrow::utf8()),
      arrow::field("date", arrow::uint32()),
      arrow::field("is_intraday", arrow::boolean()),
      arrow::field("target_minute",
                   arrow::timestamp(arrow::TimeUnit::MILLI, local_tz)),
  });
}

inline std::shared_ptr<arrow::Schema> event_return_schema() {
  return arrow::schema({
      arrow::field("story_id", arrow::utf8()),
      arrow::field("ticker", arrow::utf8()),
      arrow::field("date", arrow::uint32()),
      arrow::field("is_intraday", arrow::boolean()),
      arrow::field("headline", arrow::utf8()),
      arrow::field("label", arrow::utf8()),
      arrow::field("score", arrow::float64()),
      arrow::field("open", arrow::float64()),
      arrow::field("close", arrow::float64()),
      arrow::field("prev_close", arrow::float64()),
      arrow::field("next_close", arrow::float64()),
      arrow::field("mid_t15", arrow::float64()),
      arrow::field("initial_reaction", arrow::float64()),
      arrow::field("drift", arrow::float64()),
      arrow::field("initial_reaction_status", arrow::utf8()),
      arrow::field("drift_status", arrow::utf8()),
  });
}

inline std::shared_ptr<arrow::Schema> firm_day_schema() {
  return arrow::schema({
      arrow::field("date", arrow::uint32()),
      arrow::field("ticker", arrow::utf8()),
      arrow::field("avg_score", arrow::float64()),
      arrow::field("n_stories", arrow::uint32()),
      arrow::field("initial_reaction", arrow::float64()),
      arrow::field("drift", arrow::float64()),
      arrow::field("sentiment", arrow::utf8()),
  });
}

inline std::shared_ptr<arrow::Schema> portfolio_schema() {
  return arrow::schema({
      arrow::field("date", arrow::uint32()),
      arrow::field("n_positive", arrow::uint32()),
      arrow::field("n_negative", arrow::uint32()),
      arrow::field("n_neutral", arrow::uint32()),
      arrow::field("ir_long_only", arrow::float64()),
      arrow::field("ir_short_only", arrow::float64()),
      arrow::field("ir_long_short", arrow::float64()),
      arrow::field("drift_long_only", arrow::float64()),
      arrow::field("drift_short_only", arrow::float64()),
      arrow::field("drift_long_short", arrow::float64()),
  });
}

}  // namespace newsret
