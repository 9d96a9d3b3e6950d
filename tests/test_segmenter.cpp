#include "test_fakes.hpp"
#include "common/util/checksum.hpp"

#include <numeric>

namespace pipeline_service {
namespace {

using fakes::FakeEncodedStreamReader;

EncodedStream streamOf(const std::string& quality, double duration, const std::filesystem::path& dir) {
  auto file = common::ScopedTempFile::create(dir, quality + ENCODED_FILE_SUFFIX, ".ts");
  EXPECT_TRUE(file.has_value());
  return EncodedStream{quality, std::move(*file), duration};
}

double sumOf(const std::vector<ChunkPlan>& plan) {
  return std::accumulate(plan.begin(), plan.end(), 0.0,
    [](double acc, const ChunkPlan& c) { return acc + c.duration; });
}

TEST(PlanChunksTest, CountIsCeilingOfDurationOverChunk) {
  auto plan = planChunks(10.0, 4.0);
  ASSERT_EQ(plan.size(), 3u);
  EXPECT_DOUBLE_EQ(plan[0].duration, 4.0);
  EXPECT_DOUBLE_EQ(plan[1].duration, 4.0);
  EXPECT_DOUBLE_EQ(plan[2].duration, 2.0);
  EXPECT_DOUBLE_EQ(plan[2].start, 8.0);
  EXPECT_DOUBLE_EQ(sumOf(plan), 10.0);
}

TEST(PlanChunksTest, ExactMultipleHasNoTrailingChunk) {
  EXPECT_EQ(planChunks(8.0, 4.0).size(), 2u);
  EXPECT_EQ(planChunks(8.0004, 4.0).size(), 2u);
  EXPECT_EQ(planChunks(8.5, 4.0).size(), 3u);
}

TEST(PlanChunksTest, ShortStreamIsOneChunk) {
  auto plan = planChunks(0.5, 4.0);
  ASSERT_EQ(plan.size(), 1u);
  EXPECT_DOUBLE_EQ(plan[0].duration, 0.5);
  EXPECT_EQ(plan[0].index, 0);
}

TEST(PlanChunksTest, ZeroDurationHasNoChunks) {
  EXPECT_TRUE(planChunks(0.0, 4.0).empty());
  EXPECT_TRUE(planChunks(10.0, 0.0).empty());
}

class SegmenterTest : public ::testing::Test {
protected:
  void SetUp() override { dir_ = fakes::scratchDir("segmenter"); }
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }
  std::filesystem::path dir_;
};

TEST_F(SegmenterTest, SplitsAtKeyframesOnChunkBoundaries) {
  Segmenter segmenter(std::make_shared<FakeEncodedStreamReader>(4.0), 4.0);
  auto stream = streamOf("720p", 10.0, dir_);

  auto sequence = segmenter.split(stream);
  ASSERT_TRUE(sequence.has_value());
  EXPECT_EQ(sequence->size(), 3u);

  std::vector<SegmentChunk> chunks;
  while (true) {
    auto chunk = sequence->next();
    ASSERT_TRUE(chunk.has_value()) << chunk.error().describe();
    if (!chunk->has_value()) break;
    chunks.push_back(std::move(**chunk));
  }

  ASSERT_EQ(chunks.size(), 3u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].index, static_cast<int>(i));
    EXPECT_FALSE(chunks[i].payload.empty());
    EXPECT_EQ(chunks[i].checksum, common::sha256Hex(chunks[i].payload));
  }
  EXPECT_DOUBLE_EQ(chunks[2].duration, 2.0);

  // every chunk opens on the keyframe of its window
  auto text = [](const Bytes& b) { return std::string(b.begin(), b.end()); };
  EXPECT_TRUE(text(chunks[0].payload).starts_with("720p:v:0|"));
  EXPECT_TRUE(text(chunks[1].payload).starts_with("720p:v:40|"));
  EXPECT_TRUE(text(chunks[2].payload).starts_with("720p:v:80|"));
}

TEST_F(SegmenterTest, RestartYieldsIdenticalChunks) {
  Segmenter segmenter(std::make_shared<FakeEncodedStreamReader>(4.0), 4.0);
  auto stream = streamOf("360p", 10.0, dir_);
  auto sequence = segmenter.split(stream);
  ASSERT_TRUE(sequence.has_value());

  auto collect = [&]() {
    std::vector<std::string> checksums;
    while (true) {
      auto chunk = sequence->next();
      EXPECT_TRUE(chunk.has_value());
      if (!chunk || !chunk->has_value()) break;
      checksums.push_back((*chunk)->checksum);
    }
    return checksums;
  };

  auto first = collect();
  ASSERT_TRUE(sequence->restart().has_value());
  auto second = collect();
  EXPECT_EQ(first.size(), 3u);
  EXPECT_EQ(first, second);
}

TEST_F(SegmenterTest, SequenceEndsAfterLastChunk) {
  Segmenter segmenter(std::make_shared<FakeEncodedStreamReader>(4.0), 4.0);
  auto stream = streamOf("240p", 3.0, dir_);
  auto sequence = segmenter.split(stream);
  ASSERT_TRUE(sequence.has_value());

  auto only = sequence->next();
  ASSERT_TRUE(only.has_value());
  ASSERT_TRUE(only->has_value());
  EXPECT_DOUBLE_EQ((*only)->duration, 3.0);

  auto end = sequence->next();
  ASSERT_TRUE(end.has_value());
  EXPECT_FALSE(end->has_value());
}

TEST_F(SegmenterTest, ZeroDurationStreamIsPermanentFailure) {
  Segmenter segmenter(std::make_shared<FakeEncodedStreamReader>(4.0), 4.0);
  auto stream = streamOf("240p", 0.0, dir_);
  auto sequence = segmenter.split(stream);
  ASSERT_FALSE(sequence.has_value());
  EXPECT_EQ(sequence.error().kind, ErrorKind::TranscodePermanent);
}

TEST_F(SegmenterTest, MissingKeyframesLeaveLaterChunksEmpty) {
  // keyframes only every 20s: the first window swallows every packet
  Segmenter segmenter(std::make_shared<FakeEncodedStreamReader>(20.0), 4.0);
  auto stream = streamOf("240p", 10.0, dir_);
  auto sequence = segmenter.split(stream);
  ASSERT_TRUE(sequence.has_value());

  auto first = sequence->next();
  ASSERT_TRUE(first.has_value());
  auto second = sequence->next();
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().kind, ErrorKind::TranscodePermanent);
}

} // namespace
} // namespace pipeline_service
