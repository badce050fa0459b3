#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "newsret/performance.hpp"
#include "newsret/table_reader.hpp"

// Reads a portfolio_daily.parquet written by run_event_study and prints the
// hit rate / mean / Sharpe report for every metric and leg.
//
// Usage:
//   summarize_portfolios <portfolio_daily.parquet> [--json <summary.json>]
int main(int argc, char** argv) {
  if (argc != 2 && argc != 4) {
    std::fprintf(stderr,
                 "Usage: %s <portfolio_daily.parquet> [--json <out.json>]\n",
                 argv[0]);
    return 2;
  }

  std::string json_path;
  if (argc == 4) {
    if (std::string(argv[2]) != "--json") {
      std::fprintf(stderr, "Unknown or incomplete arg: %s\n", argv[2]);
      return 2;
    }
    json_path = argv[3];
  }

  try {
    const auto days = newsret::ReadPortfolioDays(argv[1]);

    std::cout << "=== summarize_portfolios ===\n";
    std::cout << "  in = " << argv[1] << "\n";
    std::cout << "  rows = " << days.size() << "\n";

    const auto report = newsret::SummarizePerformance(days);
    newsret::PrintPerformanceReport(report, std::cout);
    if (!json_path.empty()) {
      newsret::WritePerformanceJson(report, json_path);
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "FATAL: %s\n", e.what());
    return 1;
  }
  return 0;
}
