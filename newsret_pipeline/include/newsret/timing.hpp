#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace newsret {

// Wall time spent in one named pipeline step.
struct TimingEntry {
  std::string name;
  std::chrono::steady_clock::duration duration;
};

// Process-wide collector for step timings. Worker threads may add entries
// concurrently.
class TimingRegistry {
 public:
  static TimingRegistry& Instance();

  void Add(std::string name, std::chrono::steady_clock::duration d);

  // Snapshot in insertion order.
  std::vector<TimingEntry> Entries() const;

  void Clear();

 private:
  TimingRegistry() = default;

  mutable std::mutex mu_;
  std::vector<TimingEntry> entries_;
};

class ScopeTimer {
 public:
  explicit ScopeTimer(std::string name)
      : name_(std::move(name)),
        start_(std::chrono::steady_clock::now()) {}

  ScopeTimer(const ScopeTimer&) = delete;
  ScopeTimer& operator=(const ScopeTimer&) = delete;

  ~ScopeTimer() {
    const auto end = std::chrono::steady_clock::now();
    TimingRegistry::Instance().Add(std::move(name_), end - start_);
  }

 private:
  std::string name_;
  std::chrono::steady_clock::time_point start_;
};

#define NEWSRET_CONCAT_INNER(a, b) a##b
#define NEWSRET_CONCAT(a, b) NEWSRET_CONCAT_INNER(a, b)

/// Times the enclosing scope: NEWSRET_SCOPE_TIMER("load_prices");
#define NEWSRET_SCOPE_TIMER(label) \
  ::newsret::ScopeTimer NEWSRET_CONCAT(newsret_scope_timer_, __LINE__)(label)

/// Append a timing report for the current run to a log file.
///
/// `append` defaults to true so that build_story_index and run_event_study
/// can share one timing log.
void WriteTimingReport(const std::string& out_path,
                       const std::string& program_name,
                       const std::vector<std::string>& args,
                       bool append = true);

}  // namespace newsret
