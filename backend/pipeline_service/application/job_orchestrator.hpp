#pragma once

#include "binary_store.hpp"
#include "quality_ladder.hpp"
#include "retry_policy.hpp"
#include "segmenter.hpp"
#include "domain/media_prober.hpp"
#include "domain/thumbnail_service.hpp"
#include "domain/transcoding_service.hpp"
#include "common/config/config.hpp"
#include "common/thread_pool.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace pipeline_service {

struct PipelineComponents {
  std::shared_ptr<VideoRepository> repository;
  std::shared_ptr<BinaryStore> store;
  std::shared_ptr<MediaProber> prober;
  std::shared_ptr<TranscodingService> transcoder;
  std::shared_ptr<Segmenter> segmenter;
  std::shared_ptr<ThumbnailService> thumbnailer;   // optional
  std::shared_ptr<const QualityLadderPlanner> planner;
};

/*
  Drives the per-video state machine
    uploaded -> analyzing -> processing -> ready | partially_ready | failed
  One background run per video on the pipeline pool; every rendition of a
  run is a task on the worker pool, which is shared by all videos and is the
  only thing bounding concurrent encodes.
*/
class JobOrchestrator {
public:
  JobOrchestrator(PipelineComponents components, const config::PipelineConfig& cfg);
  ~JobOrchestrator();

  JobOrchestrator(const JobOrchestrator&) = delete;
  JobOrchestrator& operator=(const JobOrchestrator&) = delete;

  // Takes the video's lease (status -> analyzing) and queues its run.
  // ConcurrencyConflict while a run for the video is not terminal.
  Result<void> submit(const std::string& video_id);

  // Stops further writes of an active run. Work already inside a worker
  // finishes but nothing more is stored.
  bool cancel(const std::string& video_id);

  // Blocks until the current run of the video, if any, has finished.
  void wait(const std::string& video_id);
  void waitAll();

  bool isActive(const std::string& video_id) const;
  size_t activeRuns() const;

  // Videos left in analyzing/processing by a previous process go back to
  // uploaded and are submitted again. Returns how many were resubmitted.
  Result<int> recoverInterrupted();

  size_t workerCapacity() const { return worker_pool_.size(); }
  // Renditions waiting for a free transcode slot.
  size_t queuedEncodes() const { return worker_pool_.queued(); }

private:
  struct ActiveRun {
    std::uint64_t run_id{0};
    std::stop_source stop;
    std::shared_future<void> done;
  };

  void runPipeline(const std::string& video_id, std::uint64_t run_id, std::stop_token stop);
  void executePipeline(const std::string& video_id, std::stop_token stop);
  Rendition processRendition(Rendition rendition, const std::string& source_path,
                             const SourceProbe& probe, std::stop_token stop);
  Result<void> attemptRendition(Rendition& rendition, std::optional<EncodedStream>& encoded,
                                const std::string& source_path, const SourceProbe& probe,
                                std::stop_token stop);
  Result<void> segmentRendition(Rendition& rendition, const EncodedStream& encoded,
                                std::stop_token stop);
  void generateThumbnails(const Video& video, const SourceProbe& probe);
  void finishRendition(Rendition& rendition, const PipelineError& error);
  void failVideo(const std::string& video_id, std::span<const VideoStatus> from,
                 const PipelineError& error);
  bool backoff(int attempt, std::stop_token stop);

  PipelineComponents components_;
  config::PipelineConfig cfg_;
  RetryPolicy retry_;

  mutable std::mutex mutex_;
  std::map<std::string, ActiveRun> runs_;
  std::uint64_t next_run_id_{1};

  common::ThreadPool worker_pool_;
  common::ThreadPool pipeline_pool_;
};

} // namespace pipeline_service
