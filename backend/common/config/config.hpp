#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>

namespace config {

struct ConnectionPoolConfig{
  size_t min_connections;
  size_t max_connections;
  std::chrono::milliseconds timeout;
  std::chrono::seconds idle_timeout;
};

struct DatabaseConfig {
  std::string host;
  unsigned int port;
  std::string user;
  std::string password;
  std::string db_name;
  std::string charset;
};

struct StreamingConfig {
  std::string host;
  int port;
};

struct RestConfig {
  std::string host;
  int port;
};

struct RetryConfig {
  int max_attempts;
  std::chrono::milliseconds base_delay;
  std::chrono::milliseconds max_delay;
};

struct PipelineConfig {
  size_t worker_capacity;      // global transcode slots shared by all videos
  size_t pipeline_threads;     // concurrent per-video pipeline runs
  double chunk_seconds;
  RetryConfig retry;
  std::chrono::seconds transcode_timeout;
  std::string temp_dir;
  std::uintmax_t max_upload_bytes;
  std::string storage;         // "mysql" or "memory"
};

struct FFmpegConfig {
  std::string codec_lib;
  std::string preset;
  int log_level;
};

// One rung of the quality ladder.
struct QualityLevelConfig {
  std::string label;
  int width;
  int height;
  long bitrate;   // bits per second
  int fps;
  std::string codec;
  std::string profile;
};

struct QualityLadderConfig {
  std::vector<QualityLevelConfig> levels;  // ascending by height
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Overlays a JSON file on the compiled-in defaults. Call once at start.
void load(const std::string& path);

// Getters
const DatabaseConfig& getDatabase() const { return database_; }
const StreamingConfig& getStreaming() const { return streaming_; }
const RestConfig& getRest() const { return rest_; }
const PipelineConfig& getPipeline() const { return pipeline_; }
const FFmpegConfig& getFFmpeg() const { return ffmpeg_; }
const QualityLadderConfig& getLadder() const { return ladder_; }
const ConnectionPoolConfig& getDBCntPool() const { return db_cp_; }

private:
  Config();

  DatabaseConfig database_;
  StreamingConfig streaming_;
  RestConfig rest_;
  PipelineConfig pipeline_;
  FFmpegConfig ffmpeg_;
  QualityLadderConfig ladder_;
  ConnectionPoolConfig db_cp_;
};

} // namespace config
