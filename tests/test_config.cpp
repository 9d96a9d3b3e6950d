#include "common/config/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <unistd.h>

namespace config {
namespace {

std::filesystem::path writeConfig(const std::string& name, const std::string& text) {
  auto path = std::filesystem::temp_directory_path() /
              (name + "_" + std::to_string(::getpid()) + ".json");
  std::ofstream(path) << text;
  return path;
}

TEST(ConfigTest, DefaultsMatchTheDocumentedPipeline) {
  const auto& pipeline = Config::getInstance().getPipeline();
  EXPECT_DOUBLE_EQ(pipeline.chunk_seconds, 4.0);
  EXPECT_EQ(pipeline.retry.max_attempts, 3);
  EXPECT_EQ(pipeline.retry.base_delay, std::chrono::milliseconds(500));
  EXPECT_EQ(pipeline.retry.max_delay, std::chrono::milliseconds(8000));
  EXPECT_EQ(pipeline.max_upload_bytes, 1024ull * 1024 * 1024);
  EXPECT_EQ(Config::getInstance().getLadder().levels.size(), 8u);
}

TEST(ConfigTest, FileOverlaysOnlyWhatItNames) {
  auto path = writeConfig("reelstream_overlay", R"({"rest": {"port": 9091}, "pipeline": {"worker_capacity": 3}})");
  auto& cfg = Config::getInstance();
  const auto streaming_port = cfg.getStreaming().port;
  const auto capacity = cfg.getPipeline().worker_capacity;

  cfg.load(path.string());
  EXPECT_EQ(cfg.getRest().port, 9091);
  EXPECT_EQ(cfg.getPipeline().worker_capacity, 3u);
  EXPECT_EQ(cfg.getStreaming().port, streaming_port);
  EXPECT_DOUBLE_EQ(cfg.getPipeline().chunk_seconds, 4.0);

  auto restore = writeConfig("reelstream_restore",
                             std::format(R"({{"pipeline": {{"worker_capacity": {}}}}})", capacity));
  cfg.load(restore.string());
  std::filesystem::remove(path);
  std::filesystem::remove(restore);
}

TEST(ConfigTest, BadFilesThrow) {
  auto& cfg = Config::getInstance();
  EXPECT_THROW(cfg.load("/nonexistent/reelstream.json"), std::runtime_error);

  auto broken = writeConfig("reelstream_broken", "{ not json");
  EXPECT_THROW(cfg.load(broken.string()), std::runtime_error);
  std::filesystem::remove(broken);
}

TEST(ConfigTest, LadderWithDuplicateOrEmptyLevelsIsRejected) {
  auto& cfg = Config::getInstance();
  const auto levels = cfg.getLadder().levels.size();

  auto duplicate = writeConfig("reelstream_dup_ladder", R"({"quality_ladder": [
    {"label": "720p", "width": 1280, "height": 720, "bitrate": 3000000},
    {"label": "720p", "width": 1280, "height": 720, "bitrate": 2500000}]})");
  EXPECT_THROW(cfg.load(duplicate.string()), std::runtime_error);

  auto zero = writeConfig("reelstream_zero_ladder", R"({"quality_ladder": [
    {"label": "360p", "width": 0, "height": 360, "bitrate": 700000}]})");
  EXPECT_THROW(cfg.load(zero.string()), std::runtime_error);

  auto no_bitrate = writeConfig("reelstream_rate_ladder", R"({"quality_ladder": [
    {"label": "360p", "width": 640, "height": 360, "bitrate": 0}]})");
  EXPECT_THROW(cfg.load(no_bitrate.string()), std::runtime_error);

  EXPECT_EQ(cfg.getLadder().levels.size(), levels);
  std::filesystem::remove(duplicate);
  std::filesystem::remove(zero);
  std::filesystem::remove(no_bitrate);
}

} // namespace
} // namespace config
