#include "manifest_builder.hpp"
#include "segmenter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <format>
#include <sstream>

namespace pipeline_service {

namespace {

struct BandwidthStep {
  int min_kbps;
  int height;
};

// highest ladder height a connection of at least min_kbps can sustain
constexpr std::array<BandwidthStep, 7> kBandwidthSteps{{
  {25000, 2160},
  {12000, 1440},
  {6000, 1080},
  {3000, 720},
  {1500, 480},
  {700, 360},
  {300, 240},
}};
constexpr int kFloorHeight = 144;
constexpr int kMobileCapHeight = 480;

int targetHeight(int bandwidth_kbps) {
  for (const auto& step : kBandwidthSteps) {
    if (bandwidth_kbps >= step.min_kbps) {
      return step.height;
    }
  }
  return kFloorHeight;
}

bool isMobile(std::string user_agent) {
  std::transform(user_agent.begin(), user_agent.end(), user_agent.begin(),
    [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return user_agent.find("mobile") != std::string::npos ||
         user_agent.find("android") != std::string::npos;
}

} // namespace

ManifestBuilder::ManifestBuilder(std::shared_ptr<BinaryStore> store) : store_(std::move(store)) {}

Result<Manifest> ManifestBuilder::build(const std::string& video_id, const ClientHint& hint) const {
  auto ready = store_->listReadyRenditions(video_id);
  if (!ready) {
    return std::unexpected(ready.error());
  }
  if (ready->empty()) {
    return std::unexpected(notFound(std::format("no ready rendition for video {}", video_id)));
  }

  Manifest manifest;
  manifest.video_id = video_id;
  for (const auto& rendition : *ready) {
    ManifestEntry entry;
    entry.quality = rendition.quality();
    entry.width = rendition.level.width;
    entry.height = rendition.level.height;
    entry.bitrate = rendition.level.bitrate;
    entry.segment_count = rendition.segment_count;
    entry.segment_duration = rendition.segment_duration;
    entry.total_duration = rendition.total_duration;
    for (const auto& chunk : planChunks(rendition.total_duration, rendition.segment_duration)) {
      entry.segment_durations.push_back(chunk.duration);
    }
    manifest.renditions.push_back(std::move(entry));
  }
  manifest.default_quality = chooseDefault(manifest.renditions, hint).quality;
  return manifest;
}

const ManifestEntry& ManifestBuilder::chooseDefault(const std::vector<ManifestEntry>& ready,
                                                    const ClientHint& hint) {
  std::optional<int> cap;
  if (hint.bandwidth_kbps) {
    cap = targetHeight(*hint.bandwidth_kbps);
  } else if (isMobile(hint.user_agent)) {
    cap = kMobileCapHeight;
  }
  if (!cap) {
    return ready.front();
  }

  const ManifestEntry* best = &ready.front();
  for (const auto& entry : ready) {
    if (entry.height <= *cap) {
      best = &entry;
    }
  }
  return *best;
}

std::string ManifestBuilder::renderMasterPlaylist(const Manifest& manifest) {
  std::ostringstream playlist;
  playlist << "#EXTM3U\n"
           << "#EXT-X-VERSION:3\n";
  for (const auto& entry : manifest.renditions) {
    playlist << std::format("#EXT-X-STREAM-INF:BANDWIDTH={},RESOLUTION={}x{},NAME=\"{}\"\n",
                            entry.bitrate, entry.width, entry.height, entry.quality)
             << entry.quality << "/index.m3u8\n";
  }
  return playlist.str();
}

std::string ManifestBuilder::renderMediaPlaylist(const ManifestEntry& entry) {
  double longest = entry.segment_duration;
  for (double d : entry.segment_durations) {
    longest = std::max(longest, d);
  }

  std::ostringstream playlist;
  playlist << "#EXTM3U\n"
           << "#EXT-X-VERSION:3\n"
           << "#EXT-X-PLAYLIST-TYPE:VOD\n"
           << "#EXT-X-TARGETDURATION:" << static_cast<int>(std::ceil(longest)) << "\n"
           << "#EXT-X-MEDIA-SEQUENCE:0\n";
  for (size_t i = 0; i < entry.segment_durations.size(); ++i) {
    playlist << std::format("#EXTINF:{:.3f},\n", entry.segment_durations[i])
             << i << ".ts\n";
  }
  playlist << "#EXT-X-ENDLIST\n";
  return playlist.str();
}

} // namespace pipeline_service
