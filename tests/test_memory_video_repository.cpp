#include "test_fakes.hpp"

namespace pipeline_service {
namespace {

class MemoryVideoRepositoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    Video video;
    video.id = "v1";
    video.owner_id = 3;
    video.info.title = "clip";
    ASSERT_TRUE(repository_.createVideo(video).has_value());
  }

  MemoryVideoRepository repository_;
};

TEST_F(MemoryVideoRepositoryTest, CompareAndSetOnlyFromExpectedStatus) {
  const std::array<VideoStatus, 1> uploaded{VideoStatus::Uploaded};
  const std::array<VideoStatus, 1> analyzing{VideoStatus::Analyzing};

  auto first = repository_.compareAndSetStatus("v1", uploaded, VideoStatus::Analyzing, "");
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(*first);

  auto second = repository_.compareAndSetStatus("v1", uploaded, VideoStatus::Analyzing, "");
  ASSERT_TRUE(second.has_value());
  EXPECT_FALSE(*second);

  ASSERT_TRUE(repository_.compareAndSetStatus("v1", analyzing, VideoStatus::Failed, "CorruptInputError: x").value());
  EXPECT_EQ(repository_.findVideo("v1")->failure_reason, "CorruptInputError: x");

  auto missing = repository_.compareAndSetStatus("v2", uploaded, VideoStatus::Analyzing, "");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST_F(MemoryVideoRepositoryTest, RowsNeedTheirParent) {
  Rendition orphan;
  orphan.video_id = "v2";
  orphan.level.label = "240p";
  EXPECT_EQ(repository_.replaceRenditions("v2", {orphan}).error().kind, ErrorKind::NotFound);

  Segment segment;
  segment.video_id = "v1";
  segment.quality = "240p";
  EXPECT_EQ(repository_.insertSegment(segment).error().kind, ErrorKind::NotFound);
  EXPECT_EQ(repository_.saveProbe("v2", fakes::makeProbe()).error().kind, ErrorKind::NotFound);
}

TEST_F(MemoryVideoRepositoryTest, RemoveCascades) {
  Rendition rendition;
  rendition.video_id = "v1";
  rendition.level.label = "240p";
  rendition.level.height = 240;
  ASSERT_TRUE(repository_.replaceRenditions("v1", {rendition}).has_value());
  Segment segment;
  segment.video_id = "v1";
  segment.quality = "240p";
  segment.payload = fakes::toBytes("ts");
  ASSERT_TRUE(repository_.insertSegment(segment).has_value());
  ASSERT_TRUE(repository_.saveProbe("v1", fakes::makeProbe()).has_value());

  EXPECT_TRUE(repository_.removeVideo("v1").value());
  EXPECT_FALSE(repository_.removeVideo("v1").value());
  EXPECT_EQ(repository_.countSegments("v1", "240p").value(), 0);
  EXPECT_TRUE(repository_.findRenditions("v1")->empty());
  EXPECT_EQ(repository_.findProbe("v1").error().kind, ErrorKind::NotFound);
  EXPECT_EQ(repository_.insertSegment(segment).error().kind, ErrorKind::NotFound);
}

TEST_F(MemoryVideoRepositoryTest, ReplaceRenditionsDropsOldSegments) {
  Rendition rendition;
  rendition.video_id = "v1";
  rendition.level.label = "240p";
  ASSERT_TRUE(repository_.replaceRenditions("v1", {rendition}).has_value());
  Segment segment;
  segment.video_id = "v1";
  segment.quality = "240p";
  ASSERT_TRUE(repository_.insertSegment(segment).has_value());

  ASSERT_TRUE(repository_.replaceRenditions("v1", {}).has_value());
  EXPECT_TRUE(repository_.findRenditions("v1")->empty());
  EXPECT_EQ(repository_.countSegments("v1", "240p").value(), 0);
}

TEST_F(MemoryVideoRepositoryTest, FindByStatus) {
  const std::array<VideoStatus, 2> in_flight{VideoStatus::Analyzing, VideoStatus::Processing};
  EXPECT_TRUE(repository_.findVideosByStatus(in_flight)->empty());
  const std::array<VideoStatus, 1> uploaded{VideoStatus::Uploaded};
  auto found = repository_.findVideosByStatus(uploaded);
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(found->size(), 1u);
  EXPECT_EQ(found->front().id, "v1");
}

} // namespace
} // namespace pipeline_service
