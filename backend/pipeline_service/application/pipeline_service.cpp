#include "pipeline_service.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <uuid/uuid.h>

namespace pipeline_service {

namespace {

constexpr size_t kMaxTitleLength = 255;

std::string trimmed(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string newVideoId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return uuid_str;
}

} // namespace

PipelineService::PipelineService(std::shared_ptr<VideoRepository> repository,
                                 std::shared_ptr<BinaryStore> store,
                                 std::shared_ptr<JobOrchestrator> orchestrator,
                                 std::shared_ptr<ManifestBuilder> manifest_builder,
                                 std::shared_ptr<SegmentServer> segment_server,
                                 std::uintmax_t max_upload_bytes)
  : repository_(std::move(repository)),
    store_(std::move(store)),
    orchestrator_(std::move(orchestrator)),
    manifest_builder_(std::move(manifest_builder)),
    segment_server_(std::move(segment_server)),
    max_upload_bytes_(max_upload_bytes) {}

Result<Video> PipelineService::registerUpload(const UploadRequest& request) {
  if (request.owner_id <= 0) {
    return std::unexpected(validationError("owner id must be positive"));
  }
  auto title = trimmed(request.title);
  if (title.empty()) {
    return std::unexpected(validationError("title must not be blank"));
  }
  if (title.size() > kMaxTitleLength) {
    return std::unexpected(validationError(std::format("title longer than {} characters", kMaxTitleLength)));
  }
  auto visibility = parseVisibility(request.visibility);
  if (!visibility) {
    return std::unexpected(validationError(std::format("unknown visibility '{}'", request.visibility)));
  }

  std::error_code ec;
  if (request.source_path.empty() || !std::filesystem::is_regular_file(request.source_path, ec)) {
    return std::unexpected(validationError(std::format("source file {} does not exist", request.source_path)));
  }
  auto size = std::filesystem::file_size(request.source_path, ec);
  if (ec) {
    return std::unexpected(validationError(std::format("cannot stat {}: {}", request.source_path, ec.message())));
  }
  if (size == 0) {
    return std::unexpected(validationError("source file is empty"));
  }
  if (size > max_upload_bytes_) {
    return std::unexpected(validationError(std::format(
      "source file of {} bytes exceeds the {} byte limit", size, max_upload_bytes_)));
  }

  Video video;
  video.id = newVideoId();
  video.owner_id = request.owner_id;
  video.info.title = std::move(title);
  video.info.description = request.description;
  video.info.category = request.category;
  video.info.tags = request.tags;
  video.info.visibility = *visibility;
  video.source_path = request.source_path;
  video.status = VideoStatus::Uploaded;
  video.created_at = Clock::now();
  video.updated_at = video.created_at;

  auto created = repository_->createVideo(video);
  if (created) {
    std::cout << "[pipeline] registered " << created->id << " (" << size << " bytes) for owner "
              << created->owner_id << std::endl;
  }
  return created;
}

Result<void> PipelineService::submit(const std::string& video_id) {
  return orchestrator_->submit(video_id);
}

Result<StatusReport> PipelineService::status(const std::string& video_id) {
  auto video = repository_->findVideo(video_id);
  if (!video) {
    return std::unexpected(video.error());
  }

  StatusReport report;
  report.video = std::move(*video);
  report.active = orchestrator_->isActive(video_id);

  if (auto probe = repository_->findProbe(video_id)) {
    report.probe = std::move(*probe);
  } else if (probe.error().kind != ErrorKind::NotFound) {
    return std::unexpected(probe.error());
  }

  auto renditions = repository_->findRenditions(video_id);
  if (!renditions) {
    return std::unexpected(renditions.error());
  }
  report.renditions = std::move(*renditions);

  if (!report.renditions.empty()) {
    size_t terminal = 0;
    for (const auto& rendition : report.renditions) {
      if (isTerminal(rendition.status)) ++terminal;
    }
    report.progress = static_cast<double>(terminal) / static_cast<double>(report.renditions.size());
  }
  return report;
}

Result<Manifest> PipelineService::manifest(const std::string& video_id, const ClientHint& hint) {
  return manifest_builder_->build(video_id, hint);
}

Result<std::string> PipelineService::masterPlaylist(const std::string& video_id, const ClientHint& hint) {
  auto built = manifest_builder_->build(video_id, hint);
  if (!built) {
    return std::unexpected(built.error());
  }
  return ManifestBuilder::renderMasterPlaylist(*built);
}

Result<std::string> PipelineService::mediaPlaylist(const std::string& video_id, const std::string& quality) {
  auto built = manifest_builder_->build(video_id);
  if (!built) {
    return std::unexpected(built.error());
  }
  for (const auto& entry : built->renditions) {
    if (entry.quality == quality) {
      return ManifestBuilder::renderMediaPlaylist(entry);
    }
  }
  return std::unexpected(notFound(std::format("rendition {}/{} is not ready", video_id, quality)));
}

Result<SegmentResponse> PipelineService::segment(const std::string& video_id, const std::string& quality,
                                                 int index, std::optional<std::string_view> range_header) {
  return segment_server_->serve(video_id, quality, index, range_header);
}

Result<Thumbnail> PipelineService::thumbnail(const std::string& video_id, const std::string& size) {
  auto requested = parseThumbnailSize(size);
  if (!requested) {
    return std::unexpected(validationError(std::format("unknown thumbnail size '{}'", size)));
  }
  auto thumbnails = store_->getThumbnails(video_id);
  if (!thumbnails) {
    return std::unexpected(thumbnails.error());
  }
  if (thumbnails->empty()) {
    return std::unexpected(notFound(std::format("no thumbnails for video {}", video_id)));
  }

  const auto* data = &thumbnails->get(*requested);
  if (data->empty()) {
    data = &thumbnails->large;
  }
  return Thumbnail{*data, thumbnails->mime_type};
}

Result<void> PipelineService::remove(const std::string& video_id) {
  orchestrator_->cancel(video_id);
  auto removed = repository_->removeVideo(video_id);
  if (!removed) {
    return std::unexpected(removed.error());
  }
  if (!*removed) {
    return std::unexpected(notFound(std::format("video {} not found", video_id)));
  }
  std::cout << "[pipeline] removed " << video_id << std::endl;
  return {};
}

Result<int> PipelineService::recoverInterrupted() {
  return orchestrator_->recoverInterrupted();
}

} // namespace pipeline_service
