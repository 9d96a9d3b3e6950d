#include "rest_api_handler.hpp"
#include "http_error.hpp"

#include <charconv>
#include <chrono>
#include <format>
#include <iostream>

namespace pipeline_service {

namespace {

int64_t epochMillis(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

nlohmann::json toJson(const Video &video) {
  return {
    {"id", video.id},
    {"owner_id", video.owner_id},
    {"title", video.info.title},
    {"description", video.info.description},
    {"category", video.info.category},
    {"tags", video.info.tags},
    {"visibility", toString(video.info.visibility)},
    {"status", toString(video.status)},
    {"failure_reason", video.failure_reason},
    {"created_at", epochMillis(video.created_at)},
    {"updated_at", epochMillis(video.updated_at)},
  };
}

nlohmann::json toJson(const Rendition &rendition) {
  return {
    {"quality", rendition.quality()},
    {"resolution", rendition.level.resolution()},
    {"bitrate", rendition.level.bitrate},
    {"status", toString(rendition.status)},
    {"attempts", rendition.attempts},
    {"segment_count", rendition.segment_count},
    {"segment_duration", rendition.segment_duration},
    {"total_duration", rendition.total_duration},
    {"total_size", rendition.total_size},
    {"failure_reason", rendition.failure_reason},
  };
}

nlohmann::json toJson(const SourceProbe &probe) {
  return {
    {"duration", probe.duration},
    {"width", probe.width},
    {"height", probe.height},
    {"codec", probe.codec},
    {"frame_rate", probe.frame_rate},
    {"container", probe.container},
    {"has_audio", probe.has_audio},
    {"file_size", probe.file_size},
  };
}

nlohmann::json toJson(const Manifest &manifest) {
  nlohmann::json renditions = nlohmann::json::array();
  for (const auto &entry : manifest.renditions) {
    renditions.push_back({
      {"quality", entry.quality},
      {"width", entry.width},
      {"height", entry.height},
      {"bitrate", entry.bitrate},
      {"segment_count", entry.segment_count},
      {"segment_duration", entry.segment_duration},
      {"total_duration", entry.total_duration},
      {"segment_durations", entry.segment_durations},
    });
  }
  return {
    {"video_id", manifest.video_id},
    {"renditions", renditions},
    {"default_quality", manifest.default_quality},
  };
}

RestApiHandler::RestApiHandler(std::shared_ptr<PipelineService> pipeline_service)
    : pipeline_service_(std::move(pipeline_service)) {}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  auto target = common::parseTarget(std::string(req.target()));
  const auto &seg = target.segments;

  if (seg.size() < 2 || seg[0] != "api" || seg[1] != "videos") {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }

  if (seg.size() == 2 && req.method() == http::verb::post) {
    nlohmann::json body;
    try {
      body = parseRequestBody(req.body());
    } catch (const std::invalid_argument &e) {
      return createErrorResponse(http::status::bad_request, e.what());
    }
    return handleCreateVideo(body);
  }

  if (seg.size() == 3 && req.method() == http::verb::delete_) {
    return handleDelete(seg[2]);
  }
  if (seg.size() == 4 && seg[3] == "submit" && req.method() == http::verb::post) {
    return handleSubmit(seg[2]);
  }
  if (seg.size() == 4 && seg[3] == "status" && req.method() == http::verb::get) {
    return handleStatus(seg[2]);
  }
  if (seg.size() == 4 && seg[3] == "manifest" && req.method() == http::verb::get) {
    return handleManifest(seg[2], target, std::string(req[http::field::user_agent]));
  }
  if (seg.size() == 5 && seg[3] == "thumbnails" && req.method() == http::verb::get) {
    return handleThumbnail(seg[2], seg[4]);
  }
  return createErrorResponse(http::status::not_found, "Endpoint not found");
}

http::response<http::string_body>
RestApiHandler::handleCreateVideo(const nlohmann::json &body) {
  if (!body.is_object()) {
    return createErrorResponse(http::status::bad_request, "Request body must be a JSON object");
  }

  UploadRequest request;
  try {
    request.owner_id = body.value("owner_id", std::int64_t{0});
    request.source_path = body.value("source_path", std::string{});
    request.title = body.value("title", std::string{});
    request.description = body.value("description", std::string{});
    request.category = body.value("category", std::string{});
    request.tags = body.value("tags", std::vector<std::string>{});
    request.visibility = body.value("visibility", std::string{"public"});
  } catch (const nlohmann::json::exception &e) {
    return createErrorResponse(http::status::bad_request, std::string("Invalid field: ") + e.what());
  }

  auto video = pipeline_service_->registerUpload(request);
  if (!video) {
    return createPipelineErrorResponse(video.error());
  }
  if (auto ret = pipeline_service_->submit(video->id); !ret) {
    return createPipelineErrorResponse(ret.error());
  }

  std::cout << std::format("[rest] registered video {} for owner {}", video->id, video->owner_id) << std::endl;
  nlohmann::json response_json = {{"success", true}, {"video", toJson(*video)}};
  response_json["video"]["status"] = toString(VideoStatus::Analyzing);
  return createJsonResponse(http::status::created, response_json);
}

http::response<http::string_body>
RestApiHandler::handleSubmit(const std::string &video_id) {
  if (auto ret = pipeline_service_->submit(video_id); !ret) {
    return createPipelineErrorResponse(ret.error());
  }
  nlohmann::json response_json = {{"success", true}, {"video_id", video_id}};
  return createJsonResponse(http::status::accepted, response_json);
}

http::response<http::string_body>
RestApiHandler::handleStatus(const std::string &video_id) {
  auto report = pipeline_service_->status(video_id);
  if (!report) {
    return createPipelineErrorResponse(report.error());
  }

  nlohmann::json renditions = nlohmann::json::array();
  for (const auto &r : report->renditions) {
    renditions.push_back(toJson(r));
  }
  nlohmann::json response_json = {
    {"success", true},
    {"video", toJson(report->video)},
    {"probe", report->probe ? toJson(*report->probe) : nlohmann::json(nullptr)},
    {"renditions", renditions},
    {"progress", report->progress},
    {"active", report->active},
  };
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleManifest(const std::string &video_id,
                               const common::RequestTarget &target,
                               const std::string &user_agent) {
  ClientHint hint;
  hint.user_agent = user_agent;
  if (auto it = target.query.find("bandwidth"); it != target.query.end()) {
    int kbps = 0;
    const auto &text = it->second;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), kbps);
    if (ec != std::errc{} || ptr != text.data() + text.size() || kbps < 0) {
      return createErrorResponse(http::status::bad_request, "bandwidth must be a non-negative integer (kbps)");
    }
    hint.bandwidth_kbps = kbps;
  }

  auto manifest = pipeline_service_->manifest(video_id, hint);
  if (!manifest) {
    return createPipelineErrorResponse(manifest.error());
  }
  nlohmann::json response_json = toJson(*manifest);
  response_json["success"] = true;
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::handleThumbnail(const std::string &video_id, const std::string &size) {
  auto thumbnail = pipeline_service_->thumbnail(video_id, size);
  if (!thumbnail) {
    return createPipelineErrorResponse(thumbnail.error());
  }
  return createBinaryResponse(http::status::ok,
                              std::string(thumbnail->data.begin(), thumbnail->data.end()),
                              thumbnail->mime_type);
}

http::response<http::string_body>
RestApiHandler::handleDelete(const std::string &video_id) {
  if (auto ret = pipeline_service_->remove(video_id); !ret) {
    return createPipelineErrorResponse(ret.error());
  }
  std::cout << std::format("[rest] deleted video {}", video_id) << std::endl;
  nlohmann::json response_json = {{"success", true}};
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body>
RestApiHandler::createPipelineErrorResponse(const PipelineError &error) {
  auto status = httpStatusFor(error);
  if (status == http::status::internal_server_error) {
    std::cerr << "[rest] " << error.describe() << std::endl;
  }
  nlohmann::json error_json = {
    {"success", false},
    {"error", error.describe()},
    {"kind", errorKindName(error.kind)},
  };
  return createJsonResponse(status, error_json);
}

} // namespace pipeline_service
