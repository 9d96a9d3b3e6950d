#include "config.hpp"
#include <chrono>
#include <fstream>
#include <set>
#include <stdexcept>
#include <nlohmann/json.hpp>

extern "C" {
  #include <libavutil/log.h>
}

namespace config {

namespace {

template <typename T>
void overlay(const nlohmann::json& j, const char* key, T& target) {
  if (j.contains(key)) {
    target = j.at(key).get<T>();
  }
}

void overlayMillis(const nlohmann::json& j, const char* key, std::chrono::milliseconds& target) {
  if (j.contains(key)) {
    target = std::chrono::milliseconds(j.at(key).get<long>());
  }
}

} // namespace

  Config::Config() {
    db_cp_ = {
      .min_connections = 4,
      .max_connections = 16,
      .timeout = std::chrono::milliseconds(5000),
      .idle_timeout = std::chrono::seconds(600)
    };

    database_ = {
      .host = "localhost",
      .port = 3306,
      .user = "reelstream",
      .password = "",
      .db_name = "reelstream_db",
      .charset = "utf8mb4",
    };

    streaming_ = {
      .host = "0.0.0.0",
      .port = 8080
    };

    rest_ = {
      .host = "0.0.0.0",
      .port = 8081
    };

    pipeline_ = {
      .worker_capacity = 2,
      .pipeline_threads = 4,
      .chunk_seconds = 4.0,
      .retry = {
        .max_attempts = 3,
        .base_delay = std::chrono::milliseconds(500),
        .max_delay = std::chrono::milliseconds(8000)
      },
      .transcode_timeout = std::chrono::seconds(300),
      .temp_dir = "/tmp/reelstream",
      .max_upload_bytes = 1024ull * 1024 * 1024,
      .storage = "mysql"
    };

    ffmpeg_ = {
      .codec_lib = "libx264",
      .preset = "medium",
      .log_level = AV_LOG_ERROR
    };

    ladder_.levels = {
      {"144p",   256,  144,   100'000, 15, "libx264", "baseline"},
      {"240p",   426,  240,   300'000, 24, "libx264", "baseline"},
      {"360p",   640,  360,   700'000, 30, "libx264", "main"},
      {"480p",   854,  480,  1500'000, 30, "libx264", "main"},
      {"720p",  1280,  720,  3000'000, 30, "libx264", "high"},
      {"1080p", 1920, 1080,  6000'000, 30, "libx264", "high"},
      {"1440p", 2560, 1440, 12000'000, 30, "libx264", "high"},
      {"2160p", 3840, 2160, 25000'000, 30, "libx264", "high"},
    };
  }

  void Config::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json root;
    try {
      root = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    if (root.contains("database")) {
      const auto& j = root["database"];
      overlay(j, "host", database_.host);
      overlay(j, "port", database_.port);
      overlay(j, "user", database_.user);
      overlay(j, "password", database_.password);
      overlay(j, "db_name", database_.db_name);
      overlay(j, "charset", database_.charset);
    }

    if (root.contains("connection_pool")) {
      const auto& j = root["connection_pool"];
      overlay(j, "min_connections", db_cp_.min_connections);
      overlay(j, "max_connections", db_cp_.max_connections);
      overlayMillis(j, "timeout_ms", db_cp_.timeout);
    }

    if (root.contains("streaming")) {
      overlay(root["streaming"], "host", streaming_.host);
      overlay(root["streaming"], "port", streaming_.port);
    }

    if (root.contains("rest")) {
      overlay(root["rest"], "host", rest_.host);
      overlay(root["rest"], "port", rest_.port);
    }

    if (root.contains("pipeline")) {
      const auto& j = root["pipeline"];
      overlay(j, "worker_capacity", pipeline_.worker_capacity);
      overlay(j, "pipeline_threads", pipeline_.pipeline_threads);
      overlay(j, "chunk_seconds", pipeline_.chunk_seconds);
      overlay(j, "temp_dir", pipeline_.temp_dir);
      overlay(j, "max_upload_bytes", pipeline_.max_upload_bytes);
      overlay(j, "storage", pipeline_.storage);
      if (j.contains("transcode_timeout_s")) {
        pipeline_.transcode_timeout = std::chrono::seconds(j["transcode_timeout_s"].get<long>());
      }
      if (j.contains("retry")) {
        overlay(j["retry"], "max_attempts", pipeline_.retry.max_attempts);
        overlayMillis(j["retry"], "base_delay_ms", pipeline_.retry.base_delay);
        overlayMillis(j["retry"], "max_delay_ms", pipeline_.retry.max_delay);
      }
    }

    if (root.contains("ffmpeg")) {
      overlay(root["ffmpeg"], "codec_lib", ffmpeg_.codec_lib);
      overlay(root["ffmpeg"], "preset", ffmpeg_.preset);
      overlay(root["ffmpeg"], "log_level", ffmpeg_.log_level);
    }

    if (root.contains("quality_ladder")) {
      std::vector<QualityLevelConfig> levels;
      for (const auto& item : root["quality_ladder"]) {
        levels.push_back(QualityLevelConfig{
          .label = item.at("label").get<std::string>(),
          .width = item.at("width").get<int>(),
          .height = item.at("height").get<int>(),
          .bitrate = item.at("bitrate").get<long>(),
          .fps = item.value("fps", 30),
          .codec = item.value("codec", ffmpeg_.codec_lib),
          .profile = item.value("profile", std::string("main"))
        });
      }
      if (levels.empty()) {
        throw std::runtime_error("quality_ladder must not be empty");
      }
      // renditions are keyed by label
      std::set<std::string> labels;
      for (const auto& level : levels) {
        if (level.label.empty() || !labels.insert(level.label).second) {
          throw std::runtime_error("quality_ladder label must be unique and non-empty: '" + level.label + "'");
        }
        if (level.width <= 0 || level.height <= 0 || level.bitrate <= 0 || level.fps <= 0) {
          throw std::runtime_error("quality_ladder level " + level.label + " needs positive size, bitrate and fps");
        }
      }
      ladder_.levels = std::move(levels);
    }

    if (pipeline_.worker_capacity < 1 || pipeline_.pipeline_threads < 1) {
      throw std::runtime_error("pipeline pools need at least one thread");
    }
    if (pipeline_.chunk_seconds <= 0.0) {
      throw std::runtime_error("chunk_seconds must be positive");
    }
  }
}
