#pragma once
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "application/pipeline_service.hpp"
#include "common/restful/http_server.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include "domain/streaming_service.hpp"

namespace pipeline_service {

/*
  GET /{id}/master.m3u8
  GET /{id}/{quality}/index.m3u8
  GET /{id}/{quality}/{index}.ts      honours "Range: bytes=..."
*/
class HlsRequestHandler : public common::RestApiHandlerBase {
public:
  explicit HlsRequestHandler(std::shared_ptr<PipelineService> pipeline_service);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  http::response<http::string_body> serveMasterPlaylist(const std::string& video_id, ClientHint hint);
  http::response<http::string_body> serveMediaPlaylist(const std::string& video_id, const std::string& quality);
  http::response<http::string_body> serveSegment(const std::string& video_id, const std::string& quality,
                                                 const std::string& file, const std::string& range);
  http::response<http::string_body> sendError(const PipelineError& error);

  std::shared_ptr<PipelineService> pipeline_service_;
};

class HlsServer : public StreamingService {
public:
  HlsServer(const std::string& address, unsigned short port,
            std::shared_ptr<PipelineService> pipeline_service);

  void startServer() override;
  void stopServer() override;

private:
  std::string address_;
  unsigned short port_;
  boost::asio::io_context ioc_;
  common::HttpServer server_;
};

}
