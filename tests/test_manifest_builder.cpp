#include "test_fakes.hpp"

namespace pipeline_service {
namespace {

ManifestEntry entry(const std::string& quality, int width, int height, long bitrate) {
  ManifestEntry e;
  e.quality = quality;
  e.width = width;
  e.height = height;
  e.bitrate = bitrate;
  e.segment_duration = 4.0;
  e.total_duration = 10.0;
  e.segment_count = 3;
  e.segment_durations = {4.0, 4.0, 2.0};
  return e;
}

std::vector<ManifestEntry> ladder() {
  return {
    entry("240p", 426, 240, 300'000),
    entry("480p", 854, 480, 1500'000),
    entry("720p", 1280, 720, 3000'000),
    entry("1080p", 1920, 1080, 6000'000),
  };
}

TEST(ChooseDefaultTest, LowestWithoutHint) {
  EXPECT_EQ(ManifestBuilder::chooseDefault(ladder(), {}).quality, "240p");
}

TEST(ChooseDefaultTest, BandwidthPicksHighestSustainable) {
  auto ready = ladder();
  EXPECT_EQ(ManifestBuilder::chooseDefault(ready, {.bandwidth_kbps = 30000}).quality, "1080p");
  EXPECT_EQ(ManifestBuilder::chooseDefault(ready, {.bandwidth_kbps = 6000}).quality, "1080p");
  EXPECT_EQ(ManifestBuilder::chooseDefault(ready, {.bandwidth_kbps = 5999}).quality, "720p");
  EXPECT_EQ(ManifestBuilder::chooseDefault(ready, {.bandwidth_kbps = 2000}).quality, "480p");
  // 360p target is not ready; next lower is 240p
  EXPECT_EQ(ManifestBuilder::chooseDefault(ready, {.bandwidth_kbps = 800}).quality, "240p");
  // 144p target: nothing at or below, lowest ready
  EXPECT_EQ(ManifestBuilder::chooseDefault(ready, {.bandwidth_kbps = 100}).quality, "240p");
}

TEST(ChooseDefaultTest, MobileUserAgentCapsAt480p) {
  auto ready = ladder();
  ClientHint phone{.user_agent = "Mozilla/5.0 (Linux; Android 14) Mobile Safari"};
  EXPECT_EQ(ManifestBuilder::chooseDefault(ready, phone).quality, "480p");

  ClientHint desktop{.user_agent = "Mozilla/5.0 (X11; Linux x86_64)"};
  EXPECT_EQ(ManifestBuilder::chooseDefault(ready, desktop).quality, "240p");

  // an explicit bandwidth wins over the device
  ClientHint fast_phone{.bandwidth_kbps = 8000, .user_agent = "Android"};
  EXPECT_EQ(ManifestBuilder::chooseDefault(ready, fast_phone).quality, "1080p");
}

TEST(RenderPlaylistTest, MasterListsEveryReadyRendition) {
  Manifest manifest;
  manifest.video_id = "v1";
  manifest.renditions = {entry("240p", 426, 240, 300'000), entry("720p", 1280, 720, 3000'000)};

  auto playlist = ManifestBuilder::renderMasterPlaylist(manifest);
  EXPECT_TRUE(playlist.starts_with("#EXTM3U\n"));
  EXPECT_NE(playlist.find("#EXT-X-STREAM-INF:BANDWIDTH=300000,RESOLUTION=426x240,NAME=\"240p\"\n240p/index.m3u8\n"),
            std::string::npos);
  EXPECT_NE(playlist.find("#EXT-X-STREAM-INF:BANDWIDTH=3000000,RESOLUTION=1280x720,NAME=\"720p\"\n720p/index.m3u8\n"),
            std::string::npos);
}

TEST(RenderPlaylistTest, MediaPlaylistHasOneEntryPerSegment) {
  auto playlist = ManifestBuilder::renderMediaPlaylist(entry("720p", 1280, 720, 3000'000));
  EXPECT_NE(playlist.find("#EXT-X-TARGETDURATION:4\n"), std::string::npos);
  EXPECT_NE(playlist.find("#EXTINF:4.000,\n0.ts\n#EXTINF:4.000,\n1.ts\n#EXTINF:2.000,\n2.ts\n"),
            std::string::npos);
  EXPECT_TRUE(playlist.ends_with("#EXT-X-ENDLIST\n"));
}

class ManifestBuilderTest : public ::testing::Test {
protected:
  void SetUp() override {
    repository_ = std::make_shared<MemoryVideoRepository>();
    store_ = std::make_shared<BinaryStore>(repository_);
    builder_ = std::make_unique<ManifestBuilder>(store_);

    Video video;
    video.id = "v1";
    video.owner_id = 1;
    video.info.title = "clip";
    ASSERT_TRUE(repository_->createVideo(video).has_value());
  }

  Rendition rendition(const std::string& label, int height, RenditionStatus status) {
    Rendition r;
    r.video_id = "v1";
    r.level = QualityLevel{.label = label, .width = height * 16 / 9, .height = height, .bitrate = height * 1000L};
    r.status = status;
    r.segment_duration = 4.0;
    r.total_duration = 10.0;
    r.segment_count = status == RenditionStatus::Ready ? 3 : 0;
    return r;
  }

  std::shared_ptr<MemoryVideoRepository> repository_;
  std::shared_ptr<BinaryStore> store_;
  std::unique_ptr<ManifestBuilder> builder_;
};

TEST_F(ManifestBuilderTest, NothingReadyIsNotFound) {
  ASSERT_TRUE(repository_->replaceRenditions("v1", {rendition("240p", 240, RenditionStatus::Encoding)}).has_value());
  auto manifest = builder_->build("v1");
  ASSERT_FALSE(manifest.has_value());
  EXPECT_EQ(manifest.error().kind, ErrorKind::NotFound);
  EXPECT_EQ(builder_->build("missing").error().kind, ErrorKind::NotFound);
}

TEST_F(ManifestBuilderTest, OnlyReadyRenditionsAppear) {
  ASSERT_TRUE(repository_->replaceRenditions("v1", {
    rendition("240p", 240, RenditionStatus::Ready),
    rendition("360p", 360, RenditionStatus::Failed),
    rendition("720p", 720, RenditionStatus::Ready),
  }).has_value());

  auto manifest = builder_->build("v1", {.bandwidth_kbps = 50000});
  ASSERT_TRUE(manifest.has_value());
  ASSERT_EQ(manifest->renditions.size(), 2u);
  EXPECT_EQ(manifest->renditions[0].quality, "240p");
  EXPECT_EQ(manifest->renditions[1].quality, "720p");
  EXPECT_EQ(manifest->default_quality, "720p");
  EXPECT_EQ(manifest->renditions[1].segment_durations, (std::vector<double>{4.0, 4.0, 2.0}));
}

} // namespace
} // namespace pipeline_service
