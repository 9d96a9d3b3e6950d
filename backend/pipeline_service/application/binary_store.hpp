#pragma once

#include "domain/video_repository.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace pipeline_service {

// Byte range as a client asks for it: "a-b", "a-" (to the end) or "-n"
// (the last n bytes). Positions are inclusive.
struct ByteRange {
  std::optional<std::uint64_t> first;
  std::optional<std::uint64_t> last;
};

// Resolved part of a segment payload.
struct SegmentSlice {
  Bytes data;
  std::uint64_t first{0};
  std::uint64_t last{0};
  std::uint64_t total{0};
};

// Clamps `range` to a payload of `size` bytes; nullopt when nothing of it
// lies inside the payload.
std::optional<std::pair<std::uint64_t, std::uint64_t>> resolveRange(const ByteRange& range,
                                                                    std::uint64_t size);

// Blob access for renditions, segments and thumbnails on top of the
// repository. Segments of a rendition are appended strictly in index order,
// and a rendition only reads as ready when all of its segments are stored.
class BinaryStore {
public:
  explicit BinaryStore(std::shared_ptr<VideoRepository> repository);

  // Writes the rendition row. Marking it ready fails unless the stored
  // segment count equals rendition.segment_count.
  Result<void> putRendition(const Rendition& rendition);
  // The next segment of a rendition in `segmenting`; index must equal the
  // number already stored.
  Result<void> appendSegment(const Segment& segment);
  Result<void> putThumbnail(const std::string& video_id, const ThumbnailSet& thumbnails);

  Result<Segment> getSegment(const std::string& video_id, const std::string& quality, int index);
  // RangeNotSatisfiable when the range misses the payload entirely.
  Result<SegmentSlice> getSegmentRange(const std::string& video_id, const std::string& quality,
                                       int index, const ByteRange& range);
  Result<std::vector<Rendition>> listReadyRenditions(const std::string& video_id);
  Result<ThumbnailSet> getThumbnails(const std::string& video_id);

  Result<int> committedSegments(const std::string& video_id, const std::string& quality);
  Result<std::string> segmentChecksum(const std::string& video_id, const std::string& quality, int index);
  Result<void> discardSegments(const std::string& video_id, const std::string& quality);

private:
  Result<Rendition> readyRendition(const std::string& video_id, const std::string& quality);

  std::shared_ptr<VideoRepository> repository_;
};

} // namespace pipeline_service
