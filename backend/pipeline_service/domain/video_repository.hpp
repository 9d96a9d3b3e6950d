#pragma once

// project
#include "video.hpp"
#include "pipeline_error.hpp"

// std
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace pipeline_service {

template <typename T>
using Result = std::expected<T, PipelineError>;

// Row-level access to the video tables (videos, source_probes, renditions,
// segments, thumbnails). Removing a video removes every child row with it.
class VideoRepository {
public:
  virtual ~VideoRepository() = default;

  virtual Result<Video> createVideo(const Video& video) = 0;
  virtual Result<Video> findVideo(const std::string& id) = 0;
  virtual Result<std::vector<Video>> findVideosByStatus(std::span<const VideoStatus> statuses) = 0;
  // Moves the status to `next` only if the current one is in `expected`.
  // Returns false when the row exists but its status did not match.
  virtual Result<bool> compareAndSetStatus(const std::string& id,
                                           std::span<const VideoStatus> expected,
                                           VideoStatus next,
                                           const std::string& failure_reason) = 0;
  virtual Result<bool> removeVideo(const std::string& id) = 0;

  virtual Result<void> saveProbe(const std::string& video_id, const SourceProbe& probe) = 0;
  virtual Result<SourceProbe> findProbe(const std::string& video_id) = 0;

  // Drops the video's renditions (and their segments) and inserts the given ones.
  virtual Result<void> replaceRenditions(const std::string& video_id,
                                         const std::vector<Rendition>& renditions) = 0;
  virtual Result<void> updateRendition(const Rendition& rendition) = 0;
  virtual Result<Rendition> findRendition(const std::string& video_id, const std::string& quality) = 0;
  virtual Result<std::vector<Rendition>> findRenditions(const std::string& video_id) = 0;

  virtual Result<void> insertSegment(const Segment& segment) = 0;
  virtual Result<int> countSegments(const std::string& video_id, const std::string& quality) = 0;
  virtual Result<Segment> findSegment(const std::string& video_id, const std::string& quality, int index) = 0;
  virtual Result<std::string> findSegmentChecksum(const std::string& video_id, const std::string& quality, int index) = 0;
  virtual Result<void> deleteSegments(const std::string& video_id, const std::string& quality) = 0;

  virtual Result<void> saveThumbnails(const std::string& video_id, const ThumbnailSet& thumbnails) = 0;
  virtual Result<ThumbnailSet> findThumbnails(const std::string& video_id) = 0;
};

} // namespace pipeline_service
