#include "newsret/pipeline_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>

namespace newsret {

namespace {

using json = nlohmann::json;

void ReadString(const json& j, const char* key, std::string& out) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_string()) {
    throw std::runtime_error(std::string("config key '") + key +
                             "' must be a string");
  }
  out = it->get<std::string>();
}

void ReadInt(const json& j, const char* key, int& out) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_number_integer()) {
    throw std::runtime_error(std::string("config key '") + key +
                             "' must be an integer");
  }
  constexpr int64_t kMin = std::numeric_limits<int>::min();
  constexpr int64_t kMax = std::numeric_limits<int>::max();
  const bool in_range =
      it->is_number_unsigned()
          ? it->get<uint64_t>() <= static_cast<uint64_t>(kMax)
          : (it->get<int64_t>() >= kMin && it->get<int64_t>() <= kMax);
  if (!in_range) {
    throw std::runtime_error(std::string("config key '") + key +
                             "' is out of range: " + it->dump());
  }
  out = static_cast<int>(it->get<int64_t>());
}

void RequirePath(const std::string& value, const char* name) {
  if (value.empty()) {
    throw std::runtime_error(std::string("missing required path: ") + name);
  }
}

}  // namespace

int DefaultWorkers() {
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<int>(hw);
}

PipelineConfig LoadPipelineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open pipeline config: " + path);
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Failed to parse pipeline config " + path + ": " +
                             e.what());
  }
  if (!j.is_object()) {
    throw std::runtime_error("pipeline config must be a JSON object: " + path);
  }

  static const char* const kKnownKeys[] = {
      "labels",   "story_index", "quotes",  "prices",    "out_dir",
      "local_tz", "origin_tz",   "workers", "timing_log"};
  for (const auto& item : j.items()) {
    bool known = false;
    for (const char* k : kKnownKeys) {
      if (item.key() == k) known = true;
    }
    if (!known) {
      throw std::runtime_error("unknown config key '" + item.key() +
                               "' in " + path);
    }
  }

  PipelineConfig cfg;
  ReadString(j, "labels", cfg.labels_path);
  ReadString(j, "story_index", cfg.story_index_path);
  ReadString(j, "quotes", cfg.quotes_path);
  ReadString(j, "prices", cfg.prices_path);
  ReadString(j, "out_dir", cfg.out_dir);
  ReadString(j, "local_tz", cfg.local_tz);
  ReadString(j, "origin_tz", cfg.origin_tz);
  ReadInt(j, "workers", cfg.workers);
  ReadString(j, "timing_log", cfg.timing_log);
  return cfg;
}

void ValidatePipelineConfig(const PipelineConfig& cfg) {
  RequirePath(cfg.labels_path, "labels");
  RequirePath(cfg.story_index_path, "story_index");
  RequirePath(cfg.quotes_path, "quotes");
  RequirePath(cfg.prices_path, "prices");
  RequirePath(cfg.out_dir, "out_dir");
  FindZone(cfg.local_tz);
  FindZone(cfg.origin_tz);
  if (cfg.workers < 1) {
    throw std::runtime_error("workers must be >= 1, got " +
                             std::to_string(cfg.workers));
  }
}

void ValidateStoryIndexConfig(const StoryIndexConfig& cfg) {
  RequirePath(cfg.in_path, "in");
  RequirePath(cfg.out_path, "out");
  FindZone(cfg.local_tz);
  FindZone(cfg.origin_tz);
}

}  // namespace newsret
