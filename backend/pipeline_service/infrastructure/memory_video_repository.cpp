#include "memory_video_repository.hpp"

#include <algorithm>
#include <format>

namespace pipeline_service {

namespace {

std::string segmentKey(const std::string& video_id, const std::string& quality) {
  return video_id + "#" + quality;
}

PipelineError missingVideo(const std::string& id) {
  return notFound(std::format("video {} not found", id));
}

PipelineError missingRendition(const std::string& video_id, const std::string& quality) {
  return notFound(std::format("rendition {}/{} not found", video_id, quality));
}

} // namespace

Rendition* MemoryVideoRepository::renditionLocked(const std::string& video_id, const std::string& quality) {
  auto it = state_.renditions.find(video_id);
  if (it == state_.renditions.end()) {
    return nullptr;
  }
  auto found = std::find_if(it->second.begin(), it->second.end(),
    [&](const Rendition& r) { return r.quality() == quality; });
  return found == it->second.end() ? nullptr : &*found;
}

Result<Video> MemoryVideoRepository::createVideo(const Video& video) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.videos.contains(video.id)) {
    return std::unexpected(storageError(std::format("video {} already exists", video.id)));
  }
  state_.videos[video.id] = video;
  return video;
}

Result<Video> MemoryVideoRepository::findVideo(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.videos.find(id);
  if (it == state_.videos.end()) {
    return std::unexpected(missingVideo(id));
  }
  return it->second;
}

Result<std::vector<Video>> MemoryVideoRepository::findVideosByStatus(std::span<const VideoStatus> statuses) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Video> videos;
  for (const auto& [_, video] : state_.videos) {
    if (std::find(statuses.begin(), statuses.end(), video.status) != statuses.end()) {
      videos.push_back(video);
    }
  }
  std::sort(videos.begin(), videos.end(),
    [](const Video& a, const Video& b) { return a.created_at < b.created_at; });
  return videos;
}

Result<bool> MemoryVideoRepository::compareAndSetStatus(const std::string& id,
                                                        std::span<const VideoStatus> expected,
                                                        VideoStatus next,
                                                        const std::string& failure_reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.videos.find(id);
  if (it == state_.videos.end()) {
    return std::unexpected(missingVideo(id));
  }
  auto& video = it->second;
  if (std::find(expected.begin(), expected.end(), video.status) == expected.end()) {
    return false;
  }
  video.status = next;
  video.failure_reason = failure_reason;
  video.updated_at = Clock::now();
  return true;
}

Result<bool> MemoryVideoRepository::removeVideo(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.videos.erase(id) == 0) {
    return false;
  }
  state_.probes.erase(id);
  state_.thumbnails.erase(id);
  if (auto it = state_.renditions.find(id); it != state_.renditions.end()) {
    for (const auto& rendition : it->second) {
      state_.segments.erase(segmentKey(id, rendition.quality()));
    }
    state_.renditions.erase(it);
  }
  return true;
}

Result<void> MemoryVideoRepository::saveProbe(const std::string& video_id, const SourceProbe& probe) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_.videos.contains(video_id)) {
    return std::unexpected(missingVideo(video_id));
  }
  state_.probes[video_id] = probe;
  return {};
}

Result<SourceProbe> MemoryVideoRepository::findProbe(const std::string& video_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.probes.find(video_id);
  if (it == state_.probes.end()) {
    return std::unexpected(notFound(std::format("no probe for video {}", video_id)));
  }
  return it->second;
}

Result<void> MemoryVideoRepository::replaceRenditions(const std::string& video_id,
                                                      const std::vector<Rendition>& renditions) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_.videos.contains(video_id)) {
    return std::unexpected(missingVideo(video_id));
  }
  if (auto it = state_.renditions.find(video_id); it != state_.renditions.end()) {
    for (const auto& rendition : it->second) {
      state_.segments.erase(segmentKey(video_id, rendition.quality()));
    }
  }
  auto& rows = state_.renditions[video_id];
  rows = renditions;
  std::stable_sort(rows.begin(), rows.end(),
    [](const Rendition& a, const Rendition& b) { return a.level.height < b.level.height; });
  return {};
}

Result<void> MemoryVideoRepository::updateRendition(const Rendition& rendition) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* row = renditionLocked(rendition.video_id, rendition.quality());
  if (!row) {
    return std::unexpected(missingRendition(rendition.video_id, rendition.quality()));
  }
  *row = rendition;
  return {};
}

Result<Rendition> MemoryVideoRepository::findRendition(const std::string& video_id, const std::string& quality) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto* row = renditionLocked(video_id, quality);
  if (!row) {
    return std::unexpected(missingRendition(video_id, quality));
  }
  return *row;
}

Result<std::vector<Rendition>> MemoryVideoRepository::findRenditions(const std::string& video_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.renditions.find(video_id);
  if (it == state_.renditions.end()) {
    return std::vector<Rendition>{};
  }
  return it->second;
}

Result<void> MemoryVideoRepository::insertSegment(const Segment& segment) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!renditionLocked(segment.video_id, segment.quality)) {
    return std::unexpected(missingRendition(segment.video_id, segment.quality));
  }
  auto& rows = state_.segments[segmentKey(segment.video_id, segment.quality)];
  if (!rows.emplace(segment.index, segment).second) {
    return std::unexpected(storageError(std::format(
      "segment {} of {}/{} already stored", segment.index, segment.video_id, segment.quality)));
  }
  return {};
}

Result<int> MemoryVideoRepository::countSegments(const std::string& video_id, const std::string& quality) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.segments.find(segmentKey(video_id, quality));
  return it == state_.segments.end() ? 0 : static_cast<int>(it->second.size());
}

Result<Segment> MemoryVideoRepository::findSegment(const std::string& video_id, const std::string& quality,
                                                   int index) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.segments.find(segmentKey(video_id, quality));
  if (it != state_.segments.end()) {
    if (auto seg = it->second.find(index); seg != it->second.end()) {
      return seg->second;
    }
  }
  return std::unexpected(notFound(std::format("segment {} of {}/{} not found", index, video_id, quality)));
}

Result<std::string> MemoryVideoRepository::findSegmentChecksum(const std::string& video_id,
                                                               const std::string& quality, int index) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.segments.find(segmentKey(video_id, quality));
  if (it != state_.segments.end()) {
    if (auto seg = it->second.find(index); seg != it->second.end()) {
      return seg->second.checksum;
    }
  }
  return std::unexpected(notFound(std::format("segment {} of {}/{} not found", index, video_id, quality)));
}

Result<void> MemoryVideoRepository::deleteSegments(const std::string& video_id, const std::string& quality) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.segments.erase(segmentKey(video_id, quality));
  return {};
}

Result<void> MemoryVideoRepository::saveThumbnails(const std::string& video_id, const ThumbnailSet& thumbnails) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!state_.videos.contains(video_id)) {
    return std::unexpected(missingVideo(video_id));
  }
  state_.thumbnails[video_id] = thumbnails;
  return {};
}

Result<ThumbnailSet> MemoryVideoRepository::findThumbnails(const std::string& video_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.thumbnails.find(video_id);
  if (it == state_.thumbnails.end()) {
    return std::unexpected(notFound(std::format("no thumbnails for video {}", video_id)));
  }
  return it->second;
}

} // namespace pipeline_service
