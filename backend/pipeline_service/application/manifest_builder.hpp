#pragma once

#include "binary_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pipeline_service {

// What the player tells us about itself; both fields are optional.
struct ClientHint {
  std::optional<int> bandwidth_kbps;
  std::string user_agent;
};

struct ManifestEntry {
  std::string quality;
  int width{0};
  int height{0};
  long bitrate{0};
  int segment_count{0};
  double segment_duration{0};
  double total_duration{0};
  std::vector<double> segment_durations;
};

struct Manifest {
  std::string video_id;
  std::vector<ManifestEntry> renditions;   // ready only, ascending by height
  std::string default_quality;
};

// Read-only view of the renditions of a video that can be played right now.
class ManifestBuilder {
public:
  explicit ManifestBuilder(std::shared_ptr<BinaryStore> store);

  // NotFound while no rendition is ready, including during processing.
  Result<Manifest> build(const std::string& video_id, const ClientHint& hint = {}) const;

  // HLS master playlist; variant URIs are "<quality>/index.m3u8".
  static std::string renderMasterPlaylist(const Manifest& manifest);
  // HLS media playlist of one rendition; segment URIs are "<index>.ts".
  static std::string renderMediaPlaylist(const ManifestEntry& entry);

  // Starting rendition for the hint: lowest ready unless the bandwidth or
  // the device says otherwise.
  static const ManifestEntry& chooseDefault(const std::vector<ManifestEntry>& ready,
                                            const ClientHint& hint);

private:
  std::shared_ptr<BinaryStore> store_;
};

} // namespace pipeline_service
