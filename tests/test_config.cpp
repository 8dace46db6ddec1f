/**
 * @file test_config.cpp
 * @brief Tests for the JSON pipeline config loader.
 */
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "tap/config/config_loader.hpp"

using tap::config::ConfigErr;
using tap::config::Loader;
using tap::config::PipelineConfig;
namespace constants = tap::config::constants;

namespace {

std::string write_temp(const std::string& name, const std::string& body) {
  const auto path = (std::filesystem::temp_directory_path() / name).string();
  std::ofstream out(path, std::ios::trunc);
  out << body;
  return path;
}

} // namespace

TEST(ConfigLoader, MissingFile_Defaults) {
  auto cfg = Loader::load_from_file("/nonexistent/tap/config.json");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->deferred_queue_capacity, constants::DEFERRED_QUEUE_CAPACITY);
  EXPECT_EQ(cfg->marker_timeout_ms, constants::MARKER_TIMEOUT_MS);
  EXPECT_EQ(cfg->log_level, constants::LOG_LEVEL_DEFAULT);
}

TEST(ConfigLoader, File_Overrides) {
  const auto path = write_temp("tap_config_ok.json",
      R"({"deferred_queue_capacity": 64, "marker_timeout_ms": 2500, "log_level": "debug"})");
  auto cfg = Loader::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->deferred_queue_capacity, 64u);
  EXPECT_EQ(cfg->marker_timeout_ms, 2500u);
  EXPECT_EQ(cfg->log_level, "debug");
}

TEST(ConfigLoader, File_NotJson) {
  const auto path = write_temp("tap_config_bad.json", "{ deferred_queue_capacity: ");
  auto cfg = Loader::load_from_file(path);
  std::remove(path.c_str());
  ASSERT_FALSE(cfg);
  EXPECT_EQ(cfg.error(), ConfigErr::Malformed);
}

TEST(ConfigLoader, Json_PartialKeepsDefaults) {
  auto cfg = Loader::load_from_json(nlohmann::json{{"log_level", "warn"}});
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->log_level, "warn");
  EXPECT_EQ(cfg->deferred_queue_capacity, constants::DEFERRED_QUEUE_CAPACITY);
}

TEST(ConfigLoader, Json_Rejections) {
  struct Case { nlohmann::json doc; ConfigErr err; };
  const Case cases[] = {
    {nlohmann::json::array(),                              ConfigErr::Malformed},
    {nlohmann::json{{"deferred_queue_capacity", "big"}},   ConfigErr::Malformed},
    {nlohmann::json{{"deferred_queue_capacity", -4}},      ConfigErr::OutOfRange},
    {nlohmann::json{{"deferred_queue_capacity", 1.5}},     ConfigErr::Malformed},
    {nlohmann::json{{"deferred_queue_capacity", 100}},     ConfigErr::OutOfRange},
    {nlohmann::json{{"deferred_queue_capacity", 1}},       ConfigErr::OutOfRange},
    {nlohmann::json{{"marker_timeout_ms", 0}},             ConfigErr::OutOfRange},
    {nlohmann::json{{"log_level", 3}},                     ConfigErr::Malformed},
    {nlohmann::json{{"log_level", "chatty"}},              ConfigErr::OutOfRange},
  };
  for (const auto& c : cases) {
    auto cfg = Loader::load_from_json(c.doc);
    ASSERT_FALSE(cfg) << c.doc.dump();
    EXPECT_EQ(cfg.error(), c.err) << c.doc.dump();
  }
}
