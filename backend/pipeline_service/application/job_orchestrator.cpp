#include "job_orchestrator.hpp"

#include <array>
#include <condition_variable>
#include <format>
#include <iostream>
#include <stdexcept>

namespace pipeline_service {

namespace {

constexpr std::array kSubmittable{
  VideoStatus::Uploaded, VideoStatus::Ready, VideoStatus::PartiallyReady, VideoStatus::Failed};
constexpr std::array kAnalyzing{VideoStatus::Analyzing};
constexpr std::array kProcessing{VideoStatus::Processing};
constexpr std::array kInFlight{VideoStatus::Analyzing, VideoStatus::Processing};

} // namespace

JobOrchestrator::JobOrchestrator(PipelineComponents components, const config::PipelineConfig& cfg)
  : components_(std::move(components)),
    cfg_(cfg),
    retry_(cfg.retry),
    worker_pool_(static_cast<unsigned int>(cfg.worker_capacity), "transcode"),
    pipeline_pool_(static_cast<unsigned int>(cfg.pipeline_threads), "pipeline") {
  if (!components_.repository || !components_.store || !components_.prober ||
      !components_.transcoder || !components_.segmenter || !components_.planner) {
    throw std::invalid_argument("JobOrchestrator requires repository, store, prober, transcoder, segmenter and planner");
  }
}

JobOrchestrator::~JobOrchestrator() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [id, run] : runs_) {
    run.stop.request_stop();
  }
}

Result<void> JobOrchestrator::submit(const std::string& video_id) {
  auto video = components_.repository->findVideo(video_id);
  if (!video) {
    return std::unexpected(video.error());
  }

  auto leased = components_.repository->compareAndSetStatus(
    video_id, kSubmittable, VideoStatus::Analyzing, "");
  if (!leased) {
    return std::unexpected(leased.error());
  }
  if (!*leased) {
    return std::unexpected(conflictError(std::format(
      "video {} already has an active pipeline ({})", video_id, toString(video->status))));
  }

  // results of an earlier run are not served while the new one is planned
  if (auto ret = components_.repository->replaceRenditions(video_id, {}); !ret) {
    auto reverted = components_.repository->compareAndSetStatus(
      video_id, kAnalyzing, video->status, video->failure_reason);
    if (!reverted) {
      std::cerr << "[orchestrator] could not release lease of " << video_id << ": "
                << reverted.error().describe() << std::endl;
    }
    return std::unexpected(ret.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ActiveRun run;
  run.run_id = next_run_id_++;
  auto token = run.stop.get_token();
  run.done = pipeline_pool_.commit([this, video_id, run_id = run.run_id, token]() {
    runPipeline(video_id, run_id, token);
  }).share();
  runs_.insert_or_assign(video_id, std::move(run));

  std::cout << "[orchestrator] submitted " << video_id << std::endl;
  return {};
}

bool JobOrchestrator::cancel(const std::string& video_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(video_id);
  if (it == runs_.end()) {
    return false;
  }
  it->second.stop.request_stop();
  std::cout << "[orchestrator] cancelled run of " << video_id << std::endl;
  return true;
}

void JobOrchestrator::wait(const std::string& video_id) {
  std::shared_future<void> done;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(video_id);
    if (it == runs_.end()) {
      return;
    }
    done = it->second.done;
  }
  done.wait();
}

void JobOrchestrator::waitAll() {
  while (true) {
    std::vector<std::shared_future<void>> pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& [id, run] : runs_) {
        pending.push_back(run.done);
      }
    }
    if (pending.empty()) {
      return;
    }
    for (auto& done : pending) {
      done.wait();
    }
  }
}

bool JobOrchestrator::isActive(const std::string& video_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return runs_.contains(video_id);
}

size_t JobOrchestrator::activeRuns() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return runs_.size();
}

Result<int> JobOrchestrator::recoverInterrupted() {
  auto videos = components_.repository->findVideosByStatus(kInFlight);
  if (!videos) {
    return std::unexpected(videos.error());
  }

  int resubmitted = 0;
  for (const auto& video : *videos) {
    if (isActive(video.id)) {
      continue;
    }
    auto reset = components_.repository->compareAndSetStatus(
      video.id, kInFlight, VideoStatus::Uploaded, "");
    if (!reset || !*reset) {
      continue;
    }
    if (auto ret = submit(video.id); !ret) {
      std::cerr << "[orchestrator] could not resubmit " << video.id << ": "
                << ret.error().describe() << std::endl;
      continue;
    }
    ++resubmitted;
  }
  if (resubmitted > 0) {
    std::cout << "[orchestrator] resubmitted " << resubmitted << " interrupted videos" << std::endl;
  }
  return resubmitted;
}

void JobOrchestrator::runPipeline(const std::string& video_id, std::uint64_t run_id,
                                  std::stop_token stop) {
  try {
    if (!stop.stop_requested()) {
      executePipeline(video_id, stop);
    }
  } catch (const std::exception& e) {
    std::cerr << "[orchestrator] run of " << video_id << " aborted: " << e.what() << std::endl;
    if (!stop.stop_requested()) {
      failVideo(video_id, kInFlight, permanentTranscode(e.what()));
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(video_id);
  if (it != runs_.end() && it->second.run_id == run_id) {
    runs_.erase(it);
  }
}

void JobOrchestrator::executePipeline(const std::string& video_id, std::stop_token stop) {
  auto& repository = *components_.repository;

  auto video = repository.findVideo(video_id);
  if (!video) {
    std::cerr << "[orchestrator] " << video_id << " vanished before analysis: "
              << video.error().describe() << std::endl;
    return;
  }

  auto probe = components_.prober->probe(video->source_path);
  if (stop.stop_requested()) {
    return;
  }
  if (!probe) {
    failVideo(video_id, kAnalyzing, probe.error());
    return;
  }
  std::cout << "[orchestrator] probed " << video_id << " " << probe->debug() << std::endl;

  if (auto ret = repository.saveProbe(video_id, *probe); !ret) {
    failVideo(video_id, kAnalyzing, ret.error());
    return;
  }

  generateThumbnails(*video, *probe);

  std::vector<Rendition> renditions;
  for (auto& level : components_.planner->plan(probe->width, probe->height)) {
    Rendition rendition;
    rendition.video_id = video_id;
    rendition.level = std::move(level);
    rendition.segment_duration = components_.segmenter->chunkSeconds();
    rendition.total_duration = probe->duration;
    renditions.push_back(std::move(rendition));
  }

  if (stop.stop_requested()) {
    return;
  }
  if (auto ret = repository.replaceRenditions(video_id, renditions); !ret) {
    failVideo(video_id, kAnalyzing, ret.error());
    return;
  }
  auto processing = repository.compareAndSetStatus(video_id, kAnalyzing, VideoStatus::Processing, "");
  if (!processing || !*processing) {
    return;
  }

  std::vector<std::future<Rendition>> outcomes;
  outcomes.reserve(renditions.size());
  for (const auto& rendition : renditions) {
    outcomes.push_back(worker_pool_.commit(
      [this, rendition, source = video->source_path, probe = *probe, stop]() {
        return processRendition(rendition, source, probe, stop);
      }));
  }

  std::vector<RenditionStatus> statuses;
  std::string reasons;
  for (auto& outcome : outcomes) {
    auto rendition = outcome.get();
    statuses.push_back(rendition.status);
    if (rendition.status == RenditionStatus::Failed) {
      if (!reasons.empty()) reasons += "; ";
      reasons += std::format("{}: {}", rendition.quality(), rendition.failure_reason);
    }
  }
  if (stop.stop_requested()) {
    return;
  }

  const auto result = reconcileVideoStatus(statuses);
  auto finished = repository.compareAndSetStatus(
    video_id, kProcessing, result, result == VideoStatus::Ready ? "" : reasons);
  if (!finished) {
    std::cerr << "[orchestrator] could not finish " << video_id << ": "
              << finished.error().describe() << std::endl;
    return;
  }
  std::cout << "[orchestrator] " << video_id << " is " << toString(result) << std::endl;
}

Rendition JobOrchestrator::processRendition(Rendition rendition, const std::string& source_path,
                                            const SourceProbe& probe, std::stop_token stop) {
  std::optional<EncodedStream> encoded;
  try {
    for (int attempt = 1; ; ++attempt) {
      // queued work of a stopped run is dropped before it touches the store
      if (stop.stop_requested()) {
        return rendition;
      }
      rendition.attempts = attempt;
      auto ret = attemptRendition(rendition, encoded, source_path, probe, stop);
      if (stop.stop_requested()) {
        return rendition;
      }
      if (ret) {
        std::cout << "[orchestrator] " << rendition.video_id << "/" << rendition.quality()
                  << " ready with " << rendition.segment_count << " segments" << std::endl;
        return rendition;
      }

      const auto& error = ret.error();
      if (!error.retryable() || !retry_.shouldRetry(attempt)) {
        finishRendition(rendition, error);
        return rendition;
      }
      std::cerr << std::format("[orchestrator] {}/{} attempt {} of {} failed: {}",
        rendition.video_id, rendition.quality(), attempt, retry_.maxAttempts(), error.describe())
        << std::endl;
      if (!backoff(attempt, stop)) {
        return rendition;
      }
    }
  } catch (const std::exception& e) {
    finishRendition(rendition, permanentTranscode(e.what()));
  }
  return rendition;
}

Result<void> JobOrchestrator::attemptRendition(Rendition& rendition,
                                               std::optional<EncodedStream>& encoded,
                                               const std::string& source_path,
                                               const SourceProbe& probe,
                                               std::stop_token stop) {
  auto& store = *components_.store;

  if (!encoded) {
    rendition.status = RenditionStatus::Encoding;
    rendition.failure_reason.clear();
    if (auto ret = store.putRendition(rendition); !ret) {
      return ret;
    }
    // chunks of an earlier encode cannot be reused by a fresh one
    if (auto ret = store.discardSegments(rendition.video_id, rendition.quality()); !ret) {
      return ret;
    }
    auto stream = components_.transcoder->transcode(source_path, probe, rendition.level, stop);
    if (!stream) {
      return std::unexpected(stream.error());
    }
    encoded = std::move(*stream);
  }
  if (stop.stop_requested()) {
    return {};
  }

  rendition.status = RenditionStatus::Segmenting;
  if (auto ret = store.putRendition(rendition); !ret) {
    return ret;
  }
  return segmentRendition(rendition, *encoded, stop);
}

Result<void> JobOrchestrator::segmentRendition(Rendition& rendition, const EncodedStream& encoded,
                                               std::stop_token stop) {
  auto& store = *components_.store;
  const auto& video_id = rendition.video_id;
  const auto& quality = rendition.quality();

  auto sequence = components_.segmenter->split(encoded);
  if (!sequence) {
    return std::unexpected(sequence.error());
  }

  auto committed = store.committedSegments(video_id, quality);
  if (!committed) {
    return std::unexpected(committed.error());
  }

  std::uint64_t total_size = 0;
  double total_duration = 0;
  while (true) {
    auto chunk = sequence->next();
    if (!chunk) {
      return std::unexpected(chunk.error());
    }
    if (!chunk->has_value()) {
      break;
    }
    const auto& c = **chunk;

    if (c.index < *committed) {
      // left by an earlier attempt of this encode; it must be the same chunk
      auto stored = store.segmentChecksum(video_id, quality, c.index);
      if (!stored) {
        return std::unexpected(stored.error());
      }
      if (*stored != c.checksum) {
        if (auto ret = store.discardSegments(video_id, quality); !ret) {
          return ret;
        }
        return std::unexpected(storageError(std::format(
          "stored segment {} of {}/{} differs from the re-split stream", c.index, video_id, quality)));
      }
    } else {
      if (stop.stop_requested()) {
        return {};
      }
      Segment segment;
      segment.video_id = video_id;
      segment.quality = quality;
      segment.index = c.index;
      segment.payload = c.payload;
      segment.byte_length = c.size();
      segment.duration = c.duration;
      segment.start_time = c.start_time;
      segment.checksum = c.checksum;
      if (auto ret = store.appendSegment(segment); !ret) {
        return ret;
      }
    }
    total_size += c.size();
    total_duration += c.duration;
  }

  if (stop.stop_requested()) {
    return {};
  }
  rendition.segment_count = static_cast<int>(sequence->size());
  rendition.total_size = total_size;
  rendition.total_duration = total_duration;
  rendition.status = RenditionStatus::Ready;
  rendition.failure_reason.clear();
  return store.putRendition(rendition);
}

void JobOrchestrator::generateThumbnails(const Video& video, const SourceProbe& probe) {
  if (!components_.thumbnailer) {
    return;
  }
  auto existing = components_.store->getThumbnails(video.id);
  if (existing && !existing->empty()) {
    return;
  }

  auto thumbnails = components_.thumbnailer->generate(video.source_path, probe);
  if (!thumbnails) {
    std::cerr << "[orchestrator] thumbnails for " << video.id << " skipped: "
              << thumbnails.error().describe() << std::endl;
    return;
  }
  if (auto ret = components_.store->putThumbnail(video.id, *thumbnails); !ret) {
    std::cerr << "[orchestrator] thumbnails for " << video.id << " not stored: "
              << ret.error().describe() << std::endl;
  }
}

void JobOrchestrator::finishRendition(Rendition& rendition, const PipelineError& error) {
  rendition.status = RenditionStatus::Failed;
  rendition.failure_reason = error.describe();
  std::cerr << "[orchestrator] " << rendition.video_id << "/" << rendition.quality()
            << " failed after " << rendition.attempts << " attempts: " << rendition.failure_reason
            << std::endl;
  if (auto ret = components_.store->putRendition(rendition); !ret) {
    std::cerr << "[orchestrator] could not record failure of " << rendition.video_id << "/"
              << rendition.quality() << ": " << ret.error().describe() << std::endl;
  }
}

void JobOrchestrator::failVideo(const std::string& video_id, std::span<const VideoStatus> from,
                                const PipelineError& error) {
  std::cerr << "[orchestrator] " << video_id << " failed: " << error.describe() << std::endl;
  auto ret = components_.repository->compareAndSetStatus(
    video_id, from, VideoStatus::Failed, error.describe());
  if (!ret) {
    std::cerr << "[orchestrator] could not mark " << video_id << " failed: "
              << ret.error().describe() << std::endl;
  }
}

// Runs on the worker pool, so the rendition keeps its transcode slot while it waits.
bool JobOrchestrator::backoff(int attempt, std::stop_token stop) {
  std::mutex mutex;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait_for(lock, stop, retry_.delayAfter(attempt), [] { return false; });
  return !stop.stop_requested();
}

} // namespace pipeline_service
