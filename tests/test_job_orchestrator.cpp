#include "test_fakes.hpp"

namespace pipeline_service {
namespace {

using fakes::PipelineFixture;
using fakes::waitUntil;

class JobOrchestratorTest : public PipelineFixture {};

TEST_F(JobOrchestratorTest, HappyPathReachesReady) {
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);

  EXPECT_EQ(statusOf(id), VideoStatus::Ready);
  auto renditions = repository->findRenditions(id);
  ASSERT_TRUE(renditions.has_value());
  ASSERT_EQ(renditions->size(), 3u);
  for (const auto& r : *renditions) {
    EXPECT_EQ(r.status, RenditionStatus::Ready) << r.quality();
    EXPECT_EQ(r.segment_count, 3);
    EXPECT_EQ(repository->countSegments(id, r.quality()).value(), 3);
    EXPECT_DOUBLE_EQ(r.total_duration, 10.0);
    EXPECT_GT(r.total_size, 0u);
    EXPECT_EQ(r.attempts, 1);
  }
  EXPECT_TRUE(repository->findProbe(id).has_value());
  EXPECT_EQ(thumbnailer->calls(), 1);
  EXPECT_FALSE(orchestrator->isActive(id));
}

TEST_F(JobOrchestratorTest, PlansOnlyLevelsTheSourceCanFill) {
  auto id = upload();
  prober->probeFor(repository->findVideo(id)->source_path, fakes::makeProbe(640, 360, 6.0));
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);

  auto renditions = repository->findRenditions(id);
  ASSERT_TRUE(renditions.has_value());
  ASSERT_EQ(renditions->size(), 2u);
  EXPECT_EQ((*renditions)[0].quality(), "240p");
  EXPECT_EQ((*renditions)[1].quality(), "360p");
  EXPECT_EQ((*renditions)[1].segment_count, 2);
  EXPECT_EQ(transcoder->calls("720p"), 0);
}

TEST_F(JobOrchestratorTest, SecondSubmitWhileRunningConflicts) {
  transcoder->hold();
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());

  auto again = orchestrator->submit(id);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().kind, ErrorKind::ConcurrencyConflict);

  transcoder->release();
  orchestrator->wait(id);
  EXPECT_EQ(statusOf(id), VideoStatus::Ready);
}

TEST_F(JobOrchestratorTest, SubmitUnknownVideoIsNotFound) {
  auto ret = orchestrator->submit("no-such-video");
  ASSERT_FALSE(ret.has_value());
  EXPECT_EQ(ret.error().kind, ErrorKind::NotFound);
}

TEST_F(JobOrchestratorTest, ResubmitAfterReadyRebuildsRenditions) {
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);
  ASSERT_EQ(statusOf(id), VideoStatus::Ready);

  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);
  EXPECT_EQ(statusOf(id), VideoStatus::Ready);
  EXPECT_EQ(transcoder->calls("720p"), 2);
  EXPECT_EQ(repository->countSegments(id, "720p").value(), 3);
  // thumbnails are produced once per video
  EXPECT_EQ(thumbnailer->calls(), 1);
}

TEST_F(JobOrchestratorTest, UnsupportedSourceFailsWithoutRenditions) {
  auto id = upload();
  prober->failFor(repository->findVideo(id)->source_path, unsupportedFormat("no video stream"));
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);

  auto video = repository->findVideo(id);
  ASSERT_TRUE(video.has_value());
  EXPECT_EQ(video->status, VideoStatus::Failed);
  EXPECT_TRUE(video->failure_reason.starts_with("UnsupportedFormatError"));
  EXPECT_TRUE(repository->findRenditions(id)->empty());
  EXPECT_EQ(transcoder->calls("240p"), 0);
}

TEST_F(JobOrchestratorTest, PermanentFailureOfOneRenditionIsPartiallyReady) {
  transcoder->failNext("720p", permanentTranscode("encoder rejected profile"));
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);

  auto video = repository->findVideo(id);
  ASSERT_TRUE(video.has_value());
  EXPECT_EQ(video->status, VideoStatus::PartiallyReady);
  EXPECT_NE(video->failure_reason.find("720p"), std::string::npos);

  auto failed = repository->findRendition(id, "720p");
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->status, RenditionStatus::Failed);
  EXPECT_EQ(failed->attempts, 1);
  EXPECT_TRUE(failed->failure_reason.starts_with("TranscodeError{permanent}"));
  EXPECT_EQ(repository->countSegments(id, "720p").value(), 0);

  // the failed level is absent from what is played
  auto manifest = service->manifest(id);
  ASSERT_TRUE(manifest.has_value());
  ASSERT_EQ(manifest->renditions.size(), 2u);
  EXPECT_EQ(manifest->renditions.back().quality, "360p");
}

TEST_F(JobOrchestratorTest, EveryRenditionFailingFailsTheVideo) {
  for (const auto& label : {"240p", "360p", "720p"}) {
    transcoder->failNext(label, permanentTranscode("no encoder"));
  }
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);
  EXPECT_EQ(statusOf(id), VideoStatus::Failed);
  EXPECT_EQ(service->manifest(id).error().kind, ErrorKind::NotFound);
}

TEST_F(JobOrchestratorTest, TransientFailuresAreRetried) {
  transcoder->failNext("360p", transientTranscode("out of memory"), 2);
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);

  EXPECT_EQ(statusOf(id), VideoStatus::Ready);
  auto r = repository->findRendition(id, "360p");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->attempts, 3);
  EXPECT_EQ(transcoder->calls("360p"), 3);
}

TEST_F(JobOrchestratorTest, RetryBudgetIsBounded) {
  transcoder->failNext("360p", transientTranscode("encoder crashed"), 10);
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);

  EXPECT_EQ(statusOf(id), VideoStatus::PartiallyReady);
  auto r = repository->findRendition(id, "360p");
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->status, RenditionStatus::Failed);
  EXPECT_EQ(r->attempts, 3);
  EXPECT_EQ(transcoder->calls("360p"), 3);
  EXPECT_TRUE(r->failure_reason.starts_with("TranscodeError{transient}"));
}

TEST_F(JobOrchestratorTest, StorageFailureRetriesWithoutReencoding) {
  repository->failInserts(1);
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);

  EXPECT_EQ(statusOf(id), VideoStatus::Ready);
  auto renditions = repository->findRenditions(id);
  ASSERT_TRUE(renditions.has_value());
  int retried = 0;
  for (const auto& r : *renditions) {
    EXPECT_EQ(r.segment_count, 3);
    if (r.attempts > 1) ++retried;
  }
  EXPECT_EQ(retried, 1);
  // the encoded stream is kept across a storage retry
  EXPECT_EQ(transcoder->calls("240p") + transcoder->calls("360p") + transcoder->calls("720p"), 3);
}

TEST_F(JobOrchestratorTest, WorkerCapacityBoundsConcurrentEncodes) {
  build(2, std::chrono::milliseconds(20));
  std::vector<std::string> ids;
  for (int i = 0; i < 5; ++i) {
    ids.push_back(upload(std::format("clip {}", i)));
  }
  for (const auto& id : ids) {
    ASSERT_TRUE(orchestrator->submit(id).has_value());
  }
  orchestrator->waitAll();

  EXPECT_LE(transcoder->peakConcurrency(), 2);
  EXPECT_GE(transcoder->peakConcurrency(), 1);
  EXPECT_EQ(orchestrator->workerCapacity(), 2u);
  for (const auto& id : ids) {
    EXPECT_EQ(statusOf(id), VideoStatus::Ready);
  }
  EXPECT_EQ(orchestrator->activeRuns(), 0u);
}

TEST_F(JobOrchestratorTest, DeleteDuringProcessingStopsTheRun) {
  transcoder->hold();
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  ASSERT_TRUE(waitUntil([&] { return transcoder->entered() > 0; }));

  ASSERT_TRUE(service->remove(id).has_value());
  transcoder->release();
  orchestrator->wait(id);

  EXPECT_EQ(repository->findVideo(id).error().kind, ErrorKind::NotFound);
  EXPECT_TRUE(repository->findRenditions(id)->empty());
  for (const auto& label : {"240p", "360p", "720p"}) {
    EXPECT_EQ(repository->countSegments(id, label).value(), 0);
  }
  EXPECT_EQ(service->manifest(id).error().kind, ErrorKind::NotFound);
  EXPECT_FALSE(orchestrator->isActive(id));
}

TEST_F(JobOrchestratorTest, CancelSkipsQueuedRenditions) {
  build(1);
  transcoder->hold();
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  ASSERT_TRUE(waitUntil([&] { return transcoder->entered() == 1; }));
  ASSERT_TRUE(waitUntil([&] { return orchestrator->queuedEncodes() == 2; }));

  EXPECT_TRUE(orchestrator->cancel(id));
  transcoder->release();
  orchestrator->wait(id);

  EXPECT_EQ(transcoder->entered(), 1);
  EXPECT_EQ(transcoder->calls("240p") + transcoder->calls("360p") + transcoder->calls("720p"), 1);
  int pending = 0;
  for (const auto& r : repository->findRenditions(id).value()) {
    if (r.status == RenditionStatus::Pending) ++pending;
  }
  EXPECT_EQ(pending, 2);
  EXPECT_FALSE(orchestrator->isActive(id));
}

TEST_F(JobOrchestratorTest, CancelWithoutRunReturnsFalse) {
  EXPECT_FALSE(orchestrator->cancel("idle"));
}

TEST_F(JobOrchestratorTest, ThumbnailFailureDoesNotFailTheVideo) {
  thumbnailer->setFail(true);
  auto id = upload();
  ASSERT_TRUE(orchestrator->submit(id).has_value());
  orchestrator->wait(id);
  EXPECT_EQ(statusOf(id), VideoStatus::Ready);
  EXPECT_EQ(repository->findThumbnails(id).error().kind, ErrorKind::NotFound);
}

TEST_F(JobOrchestratorTest, RecoverResubmitsInterruptedVideos) {
  auto analyzing = upload("left in analyzing");
  auto processing = upload("left in processing");
  auto untouched = upload("never submitted");
  const std::array<VideoStatus, 1> from{VideoStatus::Uploaded};
  ASSERT_TRUE(repository->compareAndSetStatus(analyzing, from, VideoStatus::Analyzing, "").value());
  ASSERT_TRUE(repository->compareAndSetStatus(processing, from, VideoStatus::Processing, "").value());

  auto recovered = orchestrator->recoverInterrupted();
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, 2);
  orchestrator->waitAll();

  EXPECT_EQ(statusOf(analyzing), VideoStatus::Ready);
  EXPECT_EQ(statusOf(processing), VideoStatus::Ready);
  EXPECT_EQ(statusOf(untouched), VideoStatus::Uploaded);
}

TEST(RetryPolicyTest, CappedExponentialDelay) {
  RetryPolicy policy(config::RetryConfig{
    .max_attempts = 3,
    .base_delay = std::chrono::milliseconds(500),
    .max_delay = std::chrono::milliseconds(8000)
  });
  EXPECT_EQ(policy.delayAfter(1), std::chrono::milliseconds(500));
  EXPECT_EQ(policy.delayAfter(2), std::chrono::milliseconds(1000));
  EXPECT_EQ(policy.delayAfter(4), std::chrono::milliseconds(4000));
  EXPECT_EQ(policy.delayAfter(5), std::chrono::milliseconds(8000));
  EXPECT_EQ(policy.delayAfter(9), std::chrono::milliseconds(8000));
  EXPECT_TRUE(policy.shouldRetry(2));
  EXPECT_FALSE(policy.shouldRetry(3));
}

TEST(JobOrchestratorConstructionTest, RequiresCoreComponents) {
  PipelineComponents components;
  auto cfg = fakes::testPipelineConfig(std::filesystem::temp_directory_path());
  EXPECT_THROW({ JobOrchestrator orchestrator(components, cfg); }, std::invalid_argument);
}

} // namespace
} // namespace pipeline_service
