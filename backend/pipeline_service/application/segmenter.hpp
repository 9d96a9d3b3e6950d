#pragma once

#include "domain/encoded_stream_reader.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pipeline_service {

struct ChunkPlan {
  int index{0};
  double start{0};
  double duration{0};
};

// ceil(total / chunk) windows of `chunk` seconds; the last one takes the
// remainder. Durations sum to `total`.
std::vector<ChunkPlan> planChunks(double total_seconds, double chunk_seconds);

struct SegmentChunk {
  int index{0};
  double start_time{0};
  double duration{0};
  Bytes payload;
  std::string checksum;
  std::uint64_t size() const { return payload.size(); }
};

// Lazy, finite walk over the chunks of one encoded stream. restart() rewinds
// the underlying source; a second pass yields byte-identical chunks.
class SegmentSequence {
public:
  SegmentSequence(std::unique_ptr<PacketSource> source, std::vector<ChunkPlan> plan);

  SegmentSequence(SegmentSequence&&) = default;
  SegmentSequence& operator=(SegmentSequence&&) = default;

  Result<std::optional<SegmentChunk>> next();
  Result<void> restart();

  size_t size() const { return plan_.size(); }
  const std::vector<ChunkPlan>& plan() const { return plan_; }

private:
  bool startsNextChunk(const MediaPacket& packet) const;

  std::unique_ptr<PacketSource> source_;
  std::vector<ChunkPlan> plan_;
  size_t next_index_{0};
  std::optional<MediaPacket> pending_;
  bool exhausted_{false};
};

class Segmenter {
public:
  Segmenter(std::shared_ptr<EncodedStreamReader> reader, double chunk_seconds);

  Result<SegmentSequence> split(const EncodedStream& stream) const;
  double chunkSeconds() const { return chunk_seconds_; }

private:
  std::shared_ptr<EncodedStreamReader> reader_;
  double chunk_seconds_;
};

} // namespace pipeline_service
