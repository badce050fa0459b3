#pragma once

#include <vector>

#include "newsret/event_types.hpp"

namespace newsret {

// Collapses stories into one row per (ticker, date).
//
//   avg_score        : mean of non-null story scores
//   initial_reaction : mean of non-null story values
//   drift            : mean of non-null story values
//   sentiment        : ClassifySentiment(avg_score), independent of the
//                      individual story labels
//
// Output is sorted by (date, ticker).
std::vector<FirmDay> AggregateFirmDays(const std::vector<EventReturn>& events);

}  // namespace newsret
