// CLI wrapper around newsret::EventStudy.
//
//  - Resolve the PipelineConfig: optional JSON file, then flag overrides
//  - Run the event study (returns, firm-days, portfolios, summary)
//  - Append a timing report when --timing-log / "timing_log" is set

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include "newsret/event_study.hpp"
#include "newsret/pipeline_config.hpp"
#include "newsret/timing.hpp"

namespace {

void usage_and_exit(const char* argv0) {
  std::fprintf(stderr,
               R"(Usage:
  %s [--config <pipeline.json>]
       --labels <labels.parquet> --story-index <story_index.parquet>
       --quotes <minute_quotes.parquet> --prices <daily_prices.parquet>
       --out-dir <dir>
       [--local-tz <zone>] [--origin-tz <zone>] [--workers <n>]
       [--timing-log <path>]

Description:
  Joins labeled stories with the story index, computes per-story initial
  reaction and drift returns against daily prices and minute quotes,
  aggregates firm-days, and builds daily long/short portfolios. Writes
  event_returns.parquet, firm_day.parquet, portfolio_daily.parquet and
  summary.json into --out-dir, then prints diagnostics and the report.

  Flags override values from --config.

Example:
  %s --config config/pipeline.json --workers 8
)",
               argv0, argv0);
  std::exit(2);
}

struct Flag {
  const char* name;
  std::string newsret::PipelineConfig::*field;
};

const Flag kPathFlags[] = {
    {"--labels", &newsret::PipelineConfig::labels_path},
    {"--story-index", &newsret::PipelineConfig::story_index_path},
    {"--quotes", &newsret::PipelineConfig::quotes_path},
    {"--prices", &newsret::PipelineConfig::prices_path},
    {"--out-dir", &newsret::PipelineConfig::out_dir},
    {"--local-tz", &newsret::PipelineConfig::local_tz},
    {"--origin-tz", &newsret::PipelineConfig::origin_tz},
    {"--timing-log", &newsret::PipelineConfig::timing_log},
};

newsret::PipelineConfig parse_args(int argc, char** argv) {
  if (argc < 2) usage_and_exit(argv[0]);

  // First pass: the config file, so that flags can override it.
  newsret::PipelineConfig cfg;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--config" && i + 1 < argc) {
      cfg = newsret::LoadPipelineConfig(argv[i + 1]);
      break;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    bool matched = false;
    for (const Flag& f : kPathFlags) {
      if (a == f.name && i + 1 < argc) {
        cfg.*(f.field) = argv[++i];
        matched = true;
        break;
      }
    }
    if (matched) continue;

    if (a == "--config" && i + 1 < argc) {
      ++i;
    } else if (a == "--workers" && i + 1 < argc) {
      cfg.workers = std::stoi(argv[++i]);
    } else if (a == "--help" || a == "-h") {
      usage_and_exit(argv[0]);
    } else {
      std::fprintf(stderr, "Unknown or incomplete arg: %s\n", a.c_str());
      usage_and_exit(argv[0]);
    }
  }

  if (cfg.workers == 0) cfg.workers = newsret::DefaultWorkers();
  return cfg;
}

}  // namespace

int main(int argc, char** argv) {
  using Clock = std::chrono::steady_clock;
  const auto program_start = Clock::now();

  try {
    newsret::PipelineConfig cfg = parse_args(argc, argv);

    newsret::EventStudy study(cfg);
    study.run();

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
