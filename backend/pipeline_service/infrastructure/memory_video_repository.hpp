#pragma once

#include "domain/video_repository.hpp"

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeline_service {

// Process-local repository with the same row semantics as the MySQL one,
// including the cascade on removeVideo. Used by tests and by deployments
// configured with storage = "memory".
class MemoryVideoRepository : public VideoRepository {
public:
  MemoryVideoRepository() = default;

  Result<Video> createVideo(const Video& video) override;
  Result<Video> findVideo(const std::string& id) override;
  Result<std::vector<Video>> findVideosByStatus(std::span<const VideoStatus> statuses) override;
  Result<bool> compareAndSetStatus(const std::string& id, std::span<const VideoStatus> expected,
                                   VideoStatus next, const std::string& failure_reason) override;
  Result<bool> removeVideo(const std::string& id) override;

  Result<void> saveProbe(const std::string& video_id, const SourceProbe& probe) override;
  Result<SourceProbe> findProbe(const std::string& video_id) override;

  Result<void> replaceRenditions(const std::string& video_id,
                                 const std::vector<Rendition>& renditions) override;
  Result<void> updateRendition(const Rendition& rendition) override;
  Result<Rendition> findRendition(const std::string& video_id, const std::string& quality) override;
  Result<std::vector<Rendition>> findRenditions(const std::string& video_id) override;

  Result<void> insertSegment(const Segment& segment) override;
  Result<int> countSegments(const std::string& video_id, const std::string& quality) override;
  Result<Segment> findSegment(const std::string& video_id, const std::string& quality, int index) override;
  Result<std::string> findSegmentChecksum(const std::string& video_id, const std::string& quality, int index) override;
  Result<void> deleteSegments(const std::string& video_id, const std::string& quality) override;

  Result<void> saveThumbnails(const std::string& video_id, const ThumbnailSet& thumbnails) override;
  Result<ThumbnailSet> findThumbnails(const std::string& video_id) override;

private:
  struct State {
    std::unordered_map<std::string, Video> videos;
    std::unordered_map<std::string, SourceProbe> probes;
    std::unordered_map<std::string, std::vector<Rendition>> renditions;
    std::unordered_map<std::string, std::map<int, Segment>> segments;   // "video#quality"
    std::unordered_map<std::string, ThumbnailSet> thumbnails;
  };

  Rendition* renditionLocked(const std::string& video_id, const std::string& quality);

  std::mutex mutex_;
  State state_;
};

} // namespace pipeline_service
