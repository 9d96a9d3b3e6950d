#include "test_fakes.hpp"
#include "infrastructure/hls_server.hpp"
#include "interface/rest_api_handler.hpp"

namespace pipeline_service {
namespace {

using Request = http::request<http::string_body>;

Request makeRequest(http::verb verb, const std::string& target, std::string body = {}) {
  Request req{verb, target, 11};
  if (!body.empty()) {
    req.set(http::field::content_type, "application/json");
    req.body() = std::move(body);
    req.prepare_payload();
  }
  return req;
}

class HttpHandlersTest : public fakes::PipelineFixture {
protected:
  void SetUp() override {
    PipelineFixture::SetUp();
    rest_ = std::make_shared<RestApiHandler>(service);
    hls_ = std::make_shared<HlsRequestHandler>(service);
  }

  http::response<http::string_body> rest(Request req) { return rest_->handleRequest(std::move(req)); }
  http::response<http::string_body> hls(Request req) { return hls_->handleRequest(std::move(req)); }

  std::string readyVideo() {
    auto id = upload();
    EXPECT_TRUE(service->submit(id).has_value());
    orchestrator->wait(id);
    return id;
  }

  std::shared_ptr<RestApiHandler> rest_;
  std::shared_ptr<HlsRequestHandler> hls_;
};

TEST_F(HttpHandlersTest, CreateVideoRegistersAndSubmits) {
  nlohmann::json body = {
    {"owner_id", 5},
    {"source_path", fakes::writeSource(dir, "rest.mp4")},
    {"title", "From REST"},
    {"tags", nlohmann::json::array({"a", "b"})},
  };
  auto res = rest(makeRequest(http::verb::post, "/api/videos", body.dump()));
  ASSERT_EQ(res.result(), http::status::created) << res.body();

  auto json = nlohmann::json::parse(res.body());
  const auto id = json["video"]["id"].get<std::string>();
  orchestrator->wait(id);
  EXPECT_EQ(statusOf(id), VideoStatus::Ready);
  EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
}

TEST_F(HttpHandlersTest, ValidationErrorsAre400) {
  nlohmann::json body = {{"owner_id", 5}, {"source_path", "/nonexistent"}, {"title", "x"}};
  auto res = rest(makeRequest(http::verb::post, "/api/videos", body.dump()));
  EXPECT_EQ(res.result(), http::status::bad_request);
  EXPECT_EQ(nlohmann::json::parse(res.body())["kind"], "ValidationError");

  auto bad_json = rest(makeRequest(http::verb::post, "/api/videos", "{not json"));
  EXPECT_EQ(bad_json.result(), http::status::bad_request);

  auto bad_bandwidth = rest(makeRequest(http::verb::get, "/api/videos/abc/manifest?bandwidth=fast"));
  EXPECT_EQ(bad_bandwidth.result(), http::status::bad_request);
}

TEST_F(HttpHandlersTest, StatusAndManifest) {
  auto id = readyVideo();

  auto status = rest(makeRequest(http::verb::get, "/api/videos/" + id + "/status"));
  ASSERT_EQ(status.result(), http::status::ok);
  auto json = nlohmann::json::parse(status.body());
  EXPECT_EQ(json["video"]["status"], "ready");
  EXPECT_EQ(json["renditions"].size(), 3u);
  EXPECT_DOUBLE_EQ(json["progress"].get<double>(), 1.0);

  auto manifest = rest(makeRequest(http::verb::get, "/api/videos/" + id + "/manifest?bandwidth=3500"));
  ASSERT_EQ(manifest.result(), http::status::ok);
  EXPECT_EQ(nlohmann::json::parse(manifest.body())["default_quality"], "720p");

  auto missing = rest(makeRequest(http::verb::get, "/api/videos/unknown/status"));
  EXPECT_EQ(missing.result(), http::status::not_found);
}

TEST_F(HttpHandlersTest, SubmitWhileRunningIs409) {
  transcoder->hold();
  auto id = upload();
  auto first = rest(makeRequest(http::verb::post, "/api/videos/" + id + "/submit"));
  EXPECT_EQ(first.result(), http::status::accepted);
  auto second = rest(makeRequest(http::verb::post, "/api/videos/" + id + "/submit"));
  EXPECT_EQ(second.result(), http::status::conflict);
  transcoder->release();
  orchestrator->wait(id);
}

TEST_F(HttpHandlersTest, ThumbnailAndDelete) {
  auto id = readyVideo();

  auto thumb = rest(makeRequest(http::verb::get, "/api/videos/" + id + "/thumbnails/medium"));
  ASSERT_EQ(thumb.result(), http::status::ok);
  EXPECT_EQ(thumb[http::field::content_type], "image/jpeg");
  EXPECT_EQ(thumb.body(), "jpeg-medium");

  auto removed = rest(makeRequest(http::verb::delete_, "/api/videos/" + id));
  EXPECT_EQ(removed.result(), http::status::ok);
  auto again = rest(makeRequest(http::verb::delete_, "/api/videos/" + id));
  EXPECT_EQ(again.result(), http::status::not_found);
}

TEST_F(HttpHandlersTest, UnknownRouteIs404) {
  EXPECT_EQ(rest(makeRequest(http::verb::get, "/api/users")).result(), http::status::not_found);
  EXPECT_EQ(rest(makeRequest(http::verb::put, "/api/videos/x/status")).result(), http::status::not_found);
}

TEST_F(HttpHandlersTest, HlsPlaylists) {
  auto id = readyVideo();

  auto master = hls(makeRequest(http::verb::get, "/" + id + "/master.m3u8"));
  ASSERT_EQ(master.result(), http::status::ok);
  EXPECT_EQ(master[http::field::content_type], "application/vnd.apple.mpegurl");
  EXPECT_NE(master.body().find("240p/index.m3u8"), std::string::npos);

  auto media = hls(makeRequest(http::verb::get, "/" + id + "/720p/index.m3u8"));
  ASSERT_EQ(media.result(), http::status::ok);
  EXPECT_NE(media.body().find("#EXT-X-ENDLIST"), std::string::npos);

  auto unknown = hls(makeRequest(http::verb::get, "/" + id + "/1080p/index.m3u8"));
  EXPECT_EQ(unknown.result(), http::status::not_found);
}

TEST_F(HttpHandlersTest, HlsSegmentsHonourRange) {
  auto id = readyVideo();
  const auto target = "/" + id + "/240p/0.ts";

  auto whole = hls(makeRequest(http::verb::get, target));
  ASSERT_EQ(whole.result(), http::status::ok);
  EXPECT_EQ(whole[http::field::content_type], "video/MP2T");
  EXPECT_EQ(whole[http::field::accept_ranges], "bytes");
  const auto size = whole.body().size();
  ASSERT_GT(size, 10u);

  auto partial_req = makeRequest(http::verb::get, target);
  partial_req.set(http::field::range, "bytes=0-9");
  auto partial = hls(std::move(partial_req));
  ASSERT_EQ(partial.result(), http::status::partial_content);
  EXPECT_EQ(partial.body(), whole.body().substr(0, 10));
  EXPECT_EQ(partial[http::field::content_range], std::format("bytes 0-9/{}", size));

  auto outside_req = makeRequest(http::verb::get, target);
  outside_req.set(http::field::range, std::format("bytes={}-", size));
  EXPECT_EQ(hls(std::move(outside_req)).result(), http::status::range_not_satisfiable);

  auto malformed_req = makeRequest(http::verb::get, target);
  malformed_req.set(http::field::range, "bytes=zz");
  EXPECT_EQ(hls(std::move(malformed_req)).result(), http::status::ok);

  EXPECT_EQ(hls(makeRequest(http::verb::get, "/" + id + "/240p/9.ts")).result(), http::status::not_found);
  EXPECT_EQ(hls(makeRequest(http::verb::get, "/" + id + "/240p/x.ts")).result(), http::status::not_found);
}

} // namespace
} // namespace pipeline_service
