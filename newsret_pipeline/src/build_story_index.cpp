#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include "newsret/pipeline_config.hpp"
#include "newsret/story_index_builder.hpp"
#include "newsret/timing.hpp"

static void usage_and_exit(const char* argv0) {
  std::fprintf(stderr,
               R"(Usage:
  %s --in <raw_stories.parquet> --out <story_index.parquet>
       [--local-tz <zone>] [--origin-tz <zone>] [--timing-log <path>]

Description:
  Maps every raw story onto the exchange trading calendar and writes the
  intraday story index used by run_event_study. For each story:
    - date         : local calendar date, or the next date when the local
                     time is at or after 16:00
    - is_intraday  : local time in [09:30, 16:00)
    - target_minute: timestamp + 15 min floored to the minute, in local
                     time (null for overnight stories)

  Naive timestamp_utc values are read as wall-clock time in --origin-tz
  (default UTC). Zoned values are used as-is. Stories without a ticker are
  skipped.

Example:
  %s --in data/news/raw_stories.parquet \
     --out data/news/story_index.parquet --local-tz America/New_York
)",
               argv0, argv0);
  std::exit(2);
}

static newsret::StoryIndexConfig parse_args(int argc, char** argv) {
  newsret::StoryIndexConfig cfg;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--in" && i + 1 < argc) {
      cfg.in_path = argv[++i];
    } else if (a == "--out" && i + 1 < argc) {
      cfg.out_path = argv[++i];
    } else if (a == "--local-tz" && i + 1 < argc) {
      cfg.local_tz = argv[++i];
    } else if (a == "--origin-tz" && i + 1 < argc) {
      cfg.origin_tz = argv[++i];
    } else if (a == "--timing-log" && i + 1 < argc) {
      cfg.timing_log = argv[++i];
    } else if (a == "--help" || a == "-h") {
      usage_and_exit(argv[0]);
    } else {
      std::fprintf(stderr, "Unknown or incomplete arg: %s\n", a.c_str());
      usage_and_exit(argv[0]);
    }
  }

  if (cfg.in_path.empty() || cfg.out_path.empty()) {
    usage_and_exit(argv[0]);
  }
  return cfg;
}

int main(int argc, char** argv) {
  using Clock = std::chrono::steady_clock;
  const auto program_start = Clock::now();

  newsret::StoryIndexConfig cfg = parse_args(argc, argv);

  try {
    newsret::ValidateStoryIndexConfig(cfg);

    newsret::StoryIndexBuilder builder(cfg);
    builder.run();

    if (!cfg.timing_log.empty()) {
      newsret::TimingRegistry::Instance().Add("program_wall_clock",
                                              Clock::now() - program_start);
      std::vector<std::string> args(argv + 1, argv + argc);
      newsret::WriteTimingReport(cfg.timing_log, argv[0], args);
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "FATAL: %s\n", e.what());
    return 1;
  }
  return 0;
}
