#include "hls_server.hpp"
#include "interface/http_error.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <boost/algorithm/string/predicate.hpp>

namespace pipeline_service {

namespace {

constexpr const char* kPlaylistContentType = "application/vnd.apple.mpegurl";

// "12.ts" -> 12
std::optional<int> segmentIndex(const std::string& file) {
  if (!boost::algorithm::ends_with(file, ".ts")) {
    return std::nullopt;
  }
  std::string_view digits(file.data(), file.size() - 3);
  int index = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
  if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size() || index < 0) {
    return std::nullopt;
  }
  return index;
}

} // namespace

HlsRequestHandler::HlsRequestHandler(std::shared_ptr<PipelineService> pipeline_service)
  : pipeline_service_(std::move(pipeline_service)) {}

http::response<http::string_body> HlsRequestHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  if (req.method() != http::verb::get && req.method() != http::verb::head) {
    return createErrorResponse(http::status::method_not_allowed, "Only GET is supported");
  }

  auto target = common::parseTarget(std::string(req.target()));
  const auto& seg = target.segments;

  if (seg.size() == 2 && seg[1] == "master.m3u8") {
    ClientHint hint;
    hint.user_agent = std::string(req[http::field::user_agent]);
    if (auto it = target.query.find("bandwidth"); it != target.query.end()) {
      int kbps = 0;
      const auto& text = it->second;
      auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), kbps);
      if (ec == std::errc{} && ptr == text.data() + text.size() && kbps >= 0) {
        hint.bandwidth_kbps = kbps;
      }
    }
    return serveMasterPlaylist(seg[0], std::move(hint));
  }
  if (seg.size() == 3 && seg[2] == "index.m3u8") {
    return serveMediaPlaylist(seg[0], seg[1]);
  }
  if (seg.size() == 3 && boost::algorithm::ends_with(seg[2], ".ts")) {
    return serveSegment(seg[0], seg[1], seg[2], std::string(req[http::field::range]));
  }
  return createErrorResponse(http::status::bad_request, "Invalid request");
}

http::response<http::string_body> HlsRequestHandler::serveMasterPlaylist(const std::string& video_id,
                                                                         ClientHint hint) {
  auto playlist = pipeline_service_->masterPlaylist(video_id, hint);
  if (!playlist) {
    return sendError(playlist.error());
  }
  return createBinaryResponse(http::status::ok, std::move(*playlist), kPlaylistContentType);
}

http::response<http::string_body> HlsRequestHandler::serveMediaPlaylist(const std::string& video_id,
                                                                        const std::string& quality) {
  auto playlist = pipeline_service_->mediaPlaylist(video_id, quality);
  if (!playlist) {
    return sendError(playlist.error());
  }
  return createBinaryResponse(http::status::ok, std::move(*playlist), kPlaylistContentType);
}

http::response<http::string_body> HlsRequestHandler::serveSegment(const std::string& video_id,
                                                                  const std::string& quality,
                                                                  const std::string& file,
                                                                  const std::string& range) {
  auto index = segmentIndex(file);
  if (!index) {
    return createErrorResponse(http::status::not_found, "Segment not found");
  }

  std::optional<std::string_view> range_header;
  if (!range.empty()) {
    range_header = range;
  }
  auto segment = pipeline_service_->segment(video_id, quality, *index, range_header);
  if (!segment) {
    return sendError(segment.error());
  }

  auto res = createBinaryResponse(segment->partial() ? http::status::partial_content : http::status::ok,
                                  std::string(segment->payload.begin(), segment->payload.end()),
                                  segment->content_type);
  res.set(http::field::accept_ranges, "bytes");
  if (segment->partial()) {
    res.set(http::field::content_range, segment->contentRange());
  }
  return res;
}

http::response<http::string_body> HlsRequestHandler::sendError(const PipelineError& error) {
  auto status = httpStatusFor(error);
  if (status == http::status::internal_server_error) {
    std::cerr << "[hls] " << error.describe() << std::endl;
  }
  auto res = createBinaryResponse(status, error.describe(), "text/plain");
  if (status == http::status::range_not_satisfiable) {
    res.set(http::field::accept_ranges, "bytes");
  }
  return res;
}

HlsServer::HlsServer(const std::string& address, unsigned short port,
                     std::shared_ptr<PipelineService> pipeline_service)
  : address_(address),
    port_(port),
    server_(ioc_,
            boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address(address), port),
            std::make_shared<HlsRequestHandler>(std::move(pipeline_service))) {}

void HlsServer::startServer() {
  std::cout << std::format("[hls] listening on {}:{}", address_, port_) << std::endl;
  server_.run();
  ioc_.run();
}

void HlsServer::stopServer() {
  ioc_.stop();
}

}
