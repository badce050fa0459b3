#include "newsret/pipeline_config.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include "parquet_fixture.hpp"

using namespace newsret;

class PipelineConfigTest : public ::testing::Test {
 protected:
  std::string WriteJson(const std::string& body) {
    const std::string path = dir_.file("pipeline.json");
    std::ofstream(path) << body;
    return path;
  }

  static PipelineConfig Complete() {
    PipelineConfig cfg;
    cfg.labels_path = "labels.parquet";
    cfg.story_index_path = "story_index.parquet";
    cfg.quotes_path = "quotes.parquet";
    cfg.prices_path = "prices.parquet";
    cfg.out_dir = "out";
    cfg.workers = 2;
    return cfg;
  }

  test::ScratchDir dir_{
      std::string("newsret_config_") +
      ::testing::UnitTest::GetInstance()->current_test_info()->name()};
};

TEST_F(PipelineConfigTest, DefaultsAreNewYorkAndUtc) {
  PipelineConfig cfg;
  EXPECT_EQ(cfg.local_tz, "America/New_York");
  EXPECT_EQ(cfg.origin_tz, "UTC");
  EXPECT_TRUE(cfg.timing_log.empty());
  EXPECT_GE(DefaultWorkers(), 1);
}

TEST_F(PipelineConfigTest, LoadsPresentKeysAndKeepsDefaults) {
  const auto cfg = LoadPipelineConfig(WriteJson(R"({
    "labels": "data/labels.parquet",
    "prices": "data/prices.parquet",
    "workers": 6,
    "local_tz": "America/Chicago"
  })"));
  EXPECT_EQ(cfg.labels_path, "data/labels.parquet");
  EXPECT_EQ(cfg.prices_path, "data/prices.parquet");
  EXPECT_EQ(cfg.workers, 6);
  EXPECT_EQ(cfg.local_tz, "America/Chicago");
  EXPECT_EQ(cfg.origin_tz, "UTC");
  EXPECT_TRUE(cfg.quotes_path.empty());
}

TEST_F(PipelineConfigTest, WrongTypeIsRejected) {
  EXPECT_THROW(LoadPipelineConfig(WriteJson(R"({"workers": "four"})")),
               std::runtime_error);
  EXPECT_THROW(LoadPipelineConfig(WriteJson(R"({"labels": 3})")),
               std::runtime_error);
}

TEST_F(PipelineConfigTest, OutOfRangeWorkersAreRejected) {
  EXPECT_THROW(LoadPipelineConfig(WriteJson(R"({"workers": 10000000000})")),
               std::runtime_error);
  EXPECT_THROW(
      LoadPipelineConfig(WriteJson(R"({"workers": 18446744073709551615})")),
      std::runtime_error);
  EXPECT_THROW(LoadPipelineConfig(WriteJson(R"({"workers": -10000000000})")),
               std::runtime_error);
  EXPECT_EQ(LoadPipelineConfig(WriteJson(R"({"workers": 2147483647})")).workers,
            2147483647);
}

TEST_F(PipelineConfigTest, UnknownKeyAndBadJsonAreRejected) {
  EXPECT_THROW(LoadPipelineConfig(WriteJson(R"({"lables": "x"})")),
               std::runtime_error);
  EXPECT_THROW(LoadPipelineConfig(WriteJson("{not json")), std::runtime_error);
  EXPECT_THROW(LoadPipelineConfig(WriteJson("[1, 2]")), std::runtime_error);
  EXPECT_THROW(LoadPipelineConfig(dir_.file("missing.json")),
               std::runtime_error);
}

TEST_F(PipelineConfigTest, ValidateAcceptsCompleteConfig) {
  EXPECT_NO_THROW(ValidatePipelineConfig(Complete()));
}

TEST_F(PipelineConfigTest, ValidateRejectsMissingPath) {
  PipelineConfig cfg = Complete();
  cfg.quotes_path.clear();
  try {
    ValidatePipelineConfig(cfg);
    FAIL() << "expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("quotes"), std::string::npos);
  }
}

TEST_F(PipelineConfigTest, ValidateRejectsUnknownZoneAndNoWorkers) {
  PipelineConfig bad_zone = Complete();
  bad_zone.origin_tz = "Not/AZone";
  EXPECT_THROW(ValidatePipelineConfig(bad_zone), std::runtime_error);

  PipelineConfig no_workers = Complete();
  no_workers.workers = 0;
  EXPECT_THROW(ValidatePipelineConfig(no_workers), std::runtime_error);
}

TEST_F(PipelineConfigTest, StoryIndexConfigNeedsPaths) {
  StoryIndexConfig cfg;
  EXPECT_THROW(ValidateStoryIndexConfig(cfg), std::runtime_error);
  cfg.in_path = "in.parquet";
  cfg.out_path = "out.parquet";
  EXPECT_NO_THROW(ValidateStoryIndexConfig(cfg));
}
