#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "binary_store.hpp"
#include "job_orchestrator.hpp"
#include "manifest_builder.hpp"
#include "segment_server.hpp"
#include "domain/video_repository.hpp"

namespace pipeline_service {

// Handoff from the upload intake: an owner already authenticated upstream, the
// raw file on disk and the metadata the user typed in.
struct UploadRequest {
  std::int64_t owner_id{0};
  std::string source_path;
  std::string title;
  std::string description;
  std::string category;
  std::vector<std::string> tags;
  std::string visibility{"public"};
};

struct StatusReport {
  Video video;
  std::optional<SourceProbe> probe;
  std::vector<Rendition> renditions;
  double progress{0};   // terminal renditions / planned renditions
  bool active{false};   // a run currently holds the video
};

struct Thumbnail {
  Bytes data;
  std::string mime_type;
};

class PipelineService {
public:
  PipelineService(std::shared_ptr<VideoRepository> repository,
                  std::shared_ptr<BinaryStore> store,
                  std::shared_ptr<JobOrchestrator> orchestrator,
                  std::shared_ptr<ManifestBuilder> manifest_builder,
                  std::shared_ptr<SegmentServer> segment_server,
                  std::uintmax_t max_upload_bytes);

  Result<Video> registerUpload(const UploadRequest& request);

  Result<void> submit(const std::string& video_id);

  Result<StatusReport> status(const std::string& video_id);

  Result<Manifest> manifest(const std::string& video_id, const ClientHint& hint = {});
  Result<std::string> masterPlaylist(const std::string& video_id, const ClientHint& hint = {});
  Result<std::string> mediaPlaylist(const std::string& video_id, const std::string& quality);

  Result<SegmentResponse> segment(const std::string& video_id, const std::string& quality, int index,
                                  std::optional<std::string_view> range_header = std::nullopt);

  // size is "small", "medium" or "large"
  Result<Thumbnail> thumbnail(const std::string& video_id, const std::string& size);

  // Stops the video's run and deletes the video with everything stored for it.
  Result<void> remove(const std::string& video_id);

  Result<int> recoverInterrupted();

private:
  std::shared_ptr<VideoRepository> repository_;
  std::shared_ptr<BinaryStore> store_;
  std::shared_ptr<JobOrchestrator> orchestrator_;
  std::shared_ptr<ManifestBuilder> manifest_builder_;
  std::shared_ptr<SegmentServer> segment_server_;
  std::uintmax_t max_upload_bytes_;
};

} // namespace pipeline_service
