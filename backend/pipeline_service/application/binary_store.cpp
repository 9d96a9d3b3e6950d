#include "binary_store.hpp"
#include "common/util/checksum.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace pipeline_service {

std::optional<std::pair<std::uint64_t, std::uint64_t>> resolveRange(const ByteRange& range,
                                                                    std::uint64_t size) {
  if (size == 0) {
    return std::nullopt;
  }
  if (!range.first) {
    // suffix form, the last n bytes
    if (!range.last || *range.last == 0) {
      return std::nullopt;
    }
    const auto n = std::min(*range.last, size);
    return std::make_pair(size - n, size - 1);
  }
  if (*range.first >= size) {
    return std::nullopt;
  }
  auto last = range.last ? std::min(*range.last, size - 1) : size - 1;
  if (last < *range.first) {
    return std::nullopt;
  }
  return std::make_pair(*range.first, last);
}

BinaryStore::BinaryStore(std::shared_ptr<VideoRepository> repository)
  : repository_(std::move(repository)) {}

Result<void> BinaryStore::putRendition(const Rendition& rendition) {
  if (rendition.status == RenditionStatus::Ready) {
    auto stored = repository_->countSegments(rendition.video_id, rendition.quality());
    if (!stored) {
      return std::unexpected(stored.error());
    }
    if (*stored != rendition.segment_count || rendition.segment_count == 0) {
      return std::unexpected(storageError(std::format(
        "rendition {}/{} claims {} segments but {} are stored",
        rendition.video_id, rendition.quality(), rendition.segment_count, *stored)));
    }
  }
  return repository_->updateRendition(rendition);
}

Result<void> BinaryStore::appendSegment(const Segment& segment) {
  auto rendition = repository_->findRendition(segment.video_id, segment.quality);
  if (!rendition) {
    return std::unexpected(rendition.error());
  }
  if (rendition->status != RenditionStatus::Segmenting) {
    return std::unexpected(storageError(std::format(
      "rendition {}/{} is {}, not segmenting", segment.video_id, segment.quality,
      toString(rendition->status))));
  }
  if (segment.payload.size() != segment.byte_length || segment.checksum.empty()) {
    return std::unexpected(storageError(std::format(
      "segment {} of {}/{} has inconsistent length or checksum",
      segment.index, segment.video_id, segment.quality)));
  }

  auto stored = repository_->countSegments(segment.video_id, segment.quality);
  if (!stored) {
    return std::unexpected(stored.error());
  }
  if (segment.index != *stored) {
    return std::unexpected(storageError(std::format(
      "segment {} of {}/{} appended out of order, next index is {}",
      segment.index, segment.video_id, segment.quality, *stored)));
  }
  return repository_->insertSegment(segment);
}

Result<void> BinaryStore::putThumbnail(const std::string& video_id, const ThumbnailSet& thumbnails) {
  return repository_->saveThumbnails(video_id, thumbnails);
}

Result<Rendition> BinaryStore::readyRendition(const std::string& video_id, const std::string& quality) {
  auto rendition = repository_->findRendition(video_id, quality);
  if (!rendition) {
    return std::unexpected(rendition.error());
  }
  if (rendition->status != RenditionStatus::Ready) {
    return std::unexpected(notFound(std::format("rendition {}/{} is not ready", video_id, quality)));
  }
  return rendition;
}

Result<Segment> BinaryStore::getSegment(const std::string& video_id, const std::string& quality, int index) {
  auto rendition = readyRendition(video_id, quality);
  if (!rendition) {
    return std::unexpected(rendition.error());
  }
  if (index < 0 || index >= rendition->segment_count) {
    return std::unexpected(notFound(std::format(
      "segment {} out of range for {}/{} ({} segments)", index, video_id, quality,
      rendition->segment_count)));
  }

  auto segment = repository_->findSegment(video_id, quality, index);
  if (!segment) {
    return std::unexpected(segment.error());
  }
  if (common::sha256Hex(segment->payload) != segment->checksum) {
    return std::unexpected(storageError(std::format(
      "checksum mismatch on segment {} of {}/{}", index, video_id, quality)));
  }
  return segment;
}

Result<SegmentSlice> BinaryStore::getSegmentRange(const std::string& video_id, const std::string& quality,
                                                  int index, const ByteRange& range) {
  auto segment = getSegment(video_id, quality, index);
  if (!segment) {
    return std::unexpected(segment.error());
  }
  const auto size = static_cast<std::uint64_t>(segment->payload.size());
  auto bounds = resolveRange(range, size);
  if (!bounds) {
    return std::unexpected(rangeNotSatisfiable(std::format(
      "range {}-{} outside segment {} of {}/{} ({} bytes)",
      range.first ? std::to_string(*range.first) : "", range.last ? std::to_string(*range.last) : "",
      index, video_id, quality, size)));
  }

  SegmentSlice slice;
  slice.first = bounds->first;
  slice.last = bounds->second;
  slice.total = size;
  auto begin = segment->payload.begin() + static_cast<std::ptrdiff_t>(slice.first);
  auto end = segment->payload.begin() + static_cast<std::ptrdiff_t>(slice.last + 1);
  slice.data.assign(begin, end);
  return slice;
}

Result<std::vector<Rendition>> BinaryStore::listReadyRenditions(const std::string& video_id) {
  auto renditions = repository_->findRenditions(video_id);
  if (!renditions) {
    return std::unexpected(renditions.error());
  }
  std::vector<Rendition> ready;
  std::copy_if(renditions->begin(), renditions->end(), std::back_inserter(ready),
    [](const Rendition& r) { return r.status == RenditionStatus::Ready; });
  std::sort(ready.begin(), ready.end(), [](const Rendition& a, const Rendition& b) {
    return a.level.height < b.level.height;
  });
  return ready;
}

Result<ThumbnailSet> BinaryStore::getThumbnails(const std::string& video_id) {
  return repository_->findThumbnails(video_id);
}

Result<int> BinaryStore::committedSegments(const std::string& video_id, const std::string& quality) {
  return repository_->countSegments(video_id, quality);
}

Result<std::string> BinaryStore::segmentChecksum(const std::string& video_id, const std::string& quality, int index) {
  return repository_->findSegmentChecksum(video_id, quality, index);
}

Result<void> BinaryStore::discardSegments(const std::string& video_id, const std::string& quality) {
  return repository_->deleteSegments(video_id, quality);
}

} // namespace pipeline_service
