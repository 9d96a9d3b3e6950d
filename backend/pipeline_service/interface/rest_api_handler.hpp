#pragma once
#include "application/pipeline_service.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace pipeline_service {

/*
  POST   /api/videos                          register + submit
  POST   /api/videos/{id}/submit
  GET    /api/videos/{id}/status
  GET    /api/videos/{id}/manifest[?bandwidth=<kbps>]
  GET    /api/videos/{id}/thumbnails/{size}
  DELETE /api/videos/{id}
*/
class RestApiHandler : public common::RestApiHandlerBase {
public:
  explicit RestApiHandler(std::shared_ptr<PipelineService> pipeline_service);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<PipelineService> pipeline_service_;

  http::response<http::string_body> handleCreateVideo(const nlohmann::json &body);
  http::response<http::string_body> handleSubmit(const std::string &video_id);
  http::response<http::string_body> handleStatus(const std::string &video_id);
  http::response<http::string_body> handleManifest(const std::string &video_id,
                                                   const common::RequestTarget &target,
                                                   const std::string &user_agent);
  http::response<http::string_body> handleThumbnail(const std::string &video_id,
                                                    const std::string &size);
  http::response<http::string_body> handleDelete(const std::string &video_id);

  http::response<http::string_body> createPipelineErrorResponse(const PipelineError &error);
};

nlohmann::json toJson(const Video &video);
nlohmann::json toJson(const Rendition &rendition);
nlohmann::json toJson(const SourceProbe &probe);
nlohmann::json toJson(const Manifest &manifest);

} // namespace pipeline_service
