#pragma once
#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pipeline_service {

using Clock = std::chrono::system_clock;
using Bytes = std::vector<std::uint8_t>;

enum class VideoStatus { Uploaded, Analyzing, Processing, Ready, PartiallyReady, Failed };
enum class RenditionStatus { Pending, Encoding, Segmenting, Ready, Failed };
enum class Visibility { Public, Private };
enum class ThumbnailSize { Small, Medium, Large };

std::string_view toString(VideoStatus status);
std::string_view toString(RenditionStatus status);
std::string_view toString(Visibility visibility);
std::string_view toString(ThumbnailSize size);
std::optional<VideoStatus> parseVideoStatus(std::string_view text);
std::optional<RenditionStatus> parseRenditionStatus(std::string_view text);
std::optional<Visibility> parseVisibility(std::string_view text);
std::optional<ThumbnailSize> parseThumbnailSize(std::string_view text);

bool isTerminal(VideoStatus status);
bool isTerminal(RenditionStatus status);

// Video outcome derived from its renditions once every one of them is terminal:
// all ready -> Ready, none ready -> Failed, otherwise PartiallyReady.
VideoStatus reconcileVideoStatus(std::span<const RenditionStatus> renditions);

// One target of the quality ladder.
struct QualityLevel {
  std::string label;   // "720p"
  int width{0};
  int height{0};
  long bitrate{0};     // in bits per second
  int fps{30};
  std::string codec;   // encoder library like "libx264"
  std::string profile;
  std::string resolution() const { return std::format("{}x{}", width, height); }
  std::string debug() const {
    return std::format("label:{},codec:{},resolution:{},bitrate:{},fps:{},profile:{}",
      label, codec, resolution(), bitrate, fps, profile);
  }
};

/*
  container metadata of the uploaded source, filled once by the prober
*/
struct SourceProbe {
  double duration{0};       // seconds
  int width{0};
  int height{0};
  std::string codec;        // decoder name like "h264", "hevc"
  double frame_rate{0};
  std::string container;    // demuxer name like "mov,mp4,m4a,3gp,3g2,mj2"
  bool has_audio{false};
  std::uintmax_t file_size{0};
  std::string debug() const {
    return std::format("container:{},codec:{},resolution:{}x{},fps:{:.3f},duration:{:.3f},audio:{}",
      container, codec, width, height, frame_rate, duration, has_audio);
  }
};

struct VideoPresentInfo {
  std::string title;
  std::string description;
  std::string category;
  std::vector<std::string> tags;
  Visibility visibility{Visibility::Public};
};

struct Video {
  std::string id;
  std::int64_t owner_id{0};
  VideoPresentInfo info;
  std::string source_path;   // durable reference to the raw upload
  VideoStatus status{VideoStatus::Uploaded};
  std::string failure_reason;
  Clock::time_point created_at{};
  Clock::time_point updated_at{};
};

struct Rendition {
  std::string video_id;
  QualityLevel level;
  RenditionStatus status{RenditionStatus::Pending};
  double total_duration{0};
  int segment_count{0};
  double segment_duration{0};   // nominal chunk length
  std::uint64_t total_size{0};
  int attempts{0};
  std::string failure_reason;
  const std::string& quality() const { return level.label; }
};

struct Segment {
  std::string video_id;
  std::string quality;
  int index{0};
  Bytes payload;
  std::uint64_t byte_length{0};
  double duration{0};
  double start_time{0};
  std::string checksum;   // sha256 hex of payload
};

struct ThumbnailSet {
  Bytes small;    // 320x180 box
  Bytes medium;   // 480x270 box
  Bytes large;    // 640x360 box
  std::string mime_type{"image/jpeg"};
  bool empty() const { return small.empty() && medium.empty() && large.empty(); }
  const Bytes& get(ThumbnailSize size) const;
};

#define ENCODED_FILE_SUFFIX "_encoded"

} // namespace pipeline_service
