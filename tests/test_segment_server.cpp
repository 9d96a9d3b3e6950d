#include "test_fakes.hpp"
#include "common/util/checksum.hpp"

namespace pipeline_service {
namespace {

TEST(ParseRangeHeaderTest, AcceptsTheThreeSingleRangeForms) {
  auto closed = parseRangeHeader("bytes=0-99");
  ASSERT_TRUE(closed.has_value());
  EXPECT_EQ(closed->first, 0u);
  EXPECT_EQ(closed->last, 99u);

  auto open = parseRangeHeader("bytes=100-");
  ASSERT_TRUE(open.has_value());
  EXPECT_EQ(open->first, 100u);
  EXPECT_FALSE(open->last.has_value());

  auto suffix = parseRangeHeader(" bytes=-50 ");
  ASSERT_TRUE(suffix.has_value());
  EXPECT_FALSE(suffix->first.has_value());
  EXPECT_EQ(suffix->last, 50u);
}

TEST(ParseRangeHeaderTest, RejectsMalformedHeaders) {
  EXPECT_FALSE(parseRangeHeader("").has_value());
  EXPECT_FALSE(parseRangeHeader("items=0-1").has_value());
  EXPECT_FALSE(parseRangeHeader("bytes=").has_value());
  EXPECT_FALSE(parseRangeHeader("bytes=-").has_value());
  EXPECT_FALSE(parseRangeHeader("bytes=abc-").has_value());
  EXPECT_FALSE(parseRangeHeader("bytes=5-1").has_value());
  EXPECT_FALSE(parseRangeHeader("bytes=0-1,5-9").has_value());
}

TEST(SegmentResponseTest, ContentRange) {
  SegmentResponse response;
  response.total_length = 1000;
  EXPECT_EQ(response.contentRange(), "bytes */1000");
  response.range = std::make_pair<std::uint64_t, std::uint64_t>(0, 99);
  EXPECT_EQ(response.contentRange(), "bytes 0-99/1000");
  EXPECT_TRUE(response.partial());
}

class SegmentServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    repository_ = std::make_shared<MemoryVideoRepository>();
    store_ = std::make_shared<BinaryStore>(repository_);
    server_ = std::make_unique<SegmentServer>(store_);

    Video video;
    video.id = "v1";
    video.owner_id = 1;
    video.info.title = "clip";
    ASSERT_TRUE(repository_->createVideo(video).has_value());

    Rendition rendition;
    rendition.video_id = "v1";
    rendition.level = QualityLevel{.label = "240p", .width = 426, .height = 240};
    rendition.status = RenditionStatus::Segmenting;
    ASSERT_TRUE(repository_->replaceRenditions("v1", {rendition}).has_value());

    Segment segment;
    segment.video_id = "v1";
    segment.quality = "240p";
    segment.index = 0;
    segment.payload = fakes::toBytes("0123456789");
    segment.byte_length = 10;
    segment.duration = 4.0;
    segment.checksum = common::sha256Hex(segment.payload);
    ASSERT_TRUE(store_->appendSegment(segment).has_value());

    rendition.status = RenditionStatus::Ready;
    rendition.segment_count = 1;
    ASSERT_TRUE(store_->putRendition(rendition).has_value());
  }

  std::shared_ptr<MemoryVideoRepository> repository_;
  std::shared_ptr<BinaryStore> store_;
  std::unique_ptr<SegmentServer> server_;
};

TEST_F(SegmentServerTest, WholeSegmentWithoutRange) {
  auto response = server_->serve("v1", "240p", 0);
  ASSERT_TRUE(response.has_value());
  EXPECT_FALSE(response->partial());
  EXPECT_EQ(response->content_type, "video/MP2T");
  EXPECT_EQ(response->total_length, 10u);
  EXPECT_EQ(response->payload, fakes::toBytes("0123456789"));
}

TEST_F(SegmentServerTest, PartialContentForValidRange) {
  auto response = server_->serve("v1", "240p", 0, "bytes=2-5");
  ASSERT_TRUE(response.has_value());
  ASSERT_TRUE(response->partial());
  EXPECT_EQ(response->payload, fakes::toBytes("2345"));
  EXPECT_EQ(response->contentRange(), "bytes 2-5/10");

  auto suffix = server_->serve("v1", "240p", 0, "bytes=-3");
  ASSERT_TRUE(suffix.has_value());
  EXPECT_EQ(suffix->payload, fakes::toBytes("789"));
}

TEST_F(SegmentServerTest, MalformedRangeFallsBackToWholeSegment) {
  auto response = server_->serve("v1", "240p", 0, "bytes=oops");
  ASSERT_TRUE(response.has_value());
  EXPECT_FALSE(response->partial());
  EXPECT_EQ(response->payload.size(), 10u);
}

TEST_F(SegmentServerTest, RangePastTheEndIsNotSatisfiable) {
  auto response = server_->serve("v1", "240p", 0, "bytes=10-");
  ASSERT_FALSE(response.has_value());
  EXPECT_EQ(response.error().kind, ErrorKind::RangeNotSatisfiable);
}

TEST_F(SegmentServerTest, UnknownSegmentIsNotFound) {
  EXPECT_EQ(server_->serve("v1", "240p", 1).error().kind, ErrorKind::NotFound);
  EXPECT_EQ(server_->serve("v2", "240p", 0).error().kind, ErrorKind::NotFound);
}

} // namespace
} // namespace pipeline_service
