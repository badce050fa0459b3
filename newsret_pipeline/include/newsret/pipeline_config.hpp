#pragma once

#include <string>

#include "newsret/trading_calendar.hpp"

namespace newsret {

inline constexpr const char* kDefaultOriginTz = "UTC";

// Settings for run_event_study. Passed by value into every stage; nothing
// here is read from global state.
struct PipelineConfig {
  // Inputs (Parquet)
  std::string labels_path;       // labeled stories
  std::string story_index_path;  // output of build_story_index
  std::string quotes_path;       // minute quote panel
  std::string prices_path;       // raw daily price panel

  // event_returns / firm_day / portfolio_daily parquet and summary.json
  std::string out_dir;

  std::string local_tz = kDefaultLocalTz;
  std::string origin_tz = kDefaultOriginTz;

  // Threads for the event-return stage. 0 until resolved from
  // hardware_concurrency by DefaultWorkers().
  int workers = 0;

  // Appended to after each run; empty disables the timing report.
  std::string timing_log;
};

// Settings for build_story_index.
struct StoryIndexConfig {
  std::string in_path;   // raw stories
  std::string out_path;  // story index
  std::string local_tz = kDefaultLocalTz;

  // Zone of naive timestamp_utc values. Always explicit; never inferred
  // from the data.
  std::string origin_tz = kDefaultOriginTz;

  std::string timing_log;
};

// std::thread::hardware_concurrency(), at least 1.
int DefaultWorkers();

// Reads a flat JSON object. Keys that are absent keep the defaults above; a
// key holding the wrong JSON type throws std::runtime_error. Unknown keys
// are rejected so that typos do not silently fall back to defaults.
PipelineConfig LoadPipelineConfig(const std::string& path);

// Throws std::runtime_error naming the first problem: a missing required
// path, an unknown timezone, or workers < 1.
void ValidatePipelineConfig(const PipelineConfig& cfg);
void ValidateStoryIndexConfig(const StoryIndexConfig& cfg);

}  // namespace newsret
