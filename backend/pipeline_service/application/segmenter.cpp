#include "segmenter.hpp"
#include "common/util/checksum.hpp"

#include <cmath>
#include <format>

namespace pipeline_service {

namespace {
// durations within this of a chunk boundary do not open another chunk
constexpr double kDurationEpsilon = 1e-3;
// keyframes this close before a boundary already belong to the next chunk
constexpr double kCutTolerance = 1e-2;
}

std::vector<ChunkPlan> planChunks(double total_seconds, double chunk_seconds) {
  std::vector<ChunkPlan> plan;
  if (total_seconds <= 0 || chunk_seconds <= 0) {
    return plan;
  }
  auto count = static_cast<int>(std::ceil((total_seconds - kDurationEpsilon) / chunk_seconds));
  if (count < 1) {
    count = 1;
  }
  plan.reserve(count);
  for (int i = 0; i < count; ++i) {
    const double start = i * chunk_seconds;
    const double duration = (i == count - 1) ? total_seconds - start : chunk_seconds;
    plan.push_back(ChunkPlan{.index = i, .start = start, .duration = duration});
  }
  return plan;
}

SegmentSequence::SegmentSequence(std::unique_ptr<PacketSource> source, std::vector<ChunkPlan> plan)
  : source_(std::move(source)), plan_(std::move(plan)) {}

bool SegmentSequence::startsNextChunk(const MediaPacket& packet) const {
  if (next_index_ + 1 >= plan_.size()) {
    return false;   // last chunk takes everything that is left
  }
  const auto& current = plan_[next_index_];
  return packet.stream_index == source_->primaryStream() &&
         packet.keyframe &&
         packet.time >= current.start + current.duration - kCutTolerance;
}

Result<std::optional<SegmentChunk>> SegmentSequence::next() {
  if (next_index_ >= plan_.size()) {
    return std::optional<SegmentChunk>{};
  }

  const auto& chunk = plan_[next_index_];
  auto muxer = source_->newMuxer();
  if (!muxer) {
    return std::unexpected(muxer.error());
  }

  size_t written = 0;
  if (pending_) {
    if (auto ret = (*muxer)->write(*pending_); !ret) {
      return std::unexpected(ret.error());
    }
    pending_.reset();
    ++written;
  }

  while (!exhausted_) {
    auto packet = source_->next();
    if (!packet) {
      return std::unexpected(packet.error());
    }
    if (!packet->has_value()) {
      exhausted_ = true;
      break;
    }
    if (written > 0 && startsNextChunk(**packet)) {
      pending_ = std::move(**packet);
      break;
    }
    if (auto ret = (*muxer)->write(**packet); !ret) {
      return std::unexpected(ret.error());
    }
    ++written;
  }

  if (written == 0) {
    return std::unexpected(permanentTranscode(std::format(
      "encoded stream has no packets for chunk {} ({:.3f}s-{:.3f}s)",
      chunk.index, chunk.start, chunk.start + chunk.duration)));
  }

  auto payload = (*muxer)->finish();
  if (!payload) {
    return std::unexpected(payload.error());
  }
  if (payload->empty()) {
    return std::unexpected(permanentTranscode(std::format("chunk {} muxed to zero bytes", chunk.index)));
  }

  SegmentChunk out;
  out.index = chunk.index;
  out.start_time = chunk.start;
  out.duration = chunk.duration;
  out.checksum = common::sha256Hex(*payload);
  out.payload = std::move(*payload);
  ++next_index_;
  return std::optional<SegmentChunk>{std::move(out)};
}

Result<void> SegmentSequence::restart() {
  if (auto ret = source_->rewind(); !ret) {
    return ret;
  }
  next_index_ = 0;
  pending_.reset();
  exhausted_ = false;
  return {};
}

Segmenter::Segmenter(std::shared_ptr<EncodedStreamReader> reader, double chunk_seconds)
  : reader_(std::move(reader)), chunk_seconds_(chunk_seconds) {}

Result<SegmentSequence> Segmenter::split(const EncodedStream& stream) const {
  auto plan = planChunks(stream.duration, chunk_seconds_);
  if (plan.empty()) {
    return std::unexpected(permanentTranscode("encoded stream " + stream.quality + " has zero duration"));
  }
  auto source = reader_->open(stream);
  if (!source) {
    return std::unexpected(source.error());
  }
  return SegmentSequence(std::move(*source), std::move(plan));
}

} // namespace pipeline_service
