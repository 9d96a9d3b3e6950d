#pragma once
#include "transcoding_service.hpp"
#include <cstdint>
#include <memory>
#include <optional>

namespace pipeline_service {

struct MediaPacket {
  int stream_index{0};
  std::int64_t pts{0};
  std::int64_t dts{0};
  std::int64_t duration{0};
  bool keyframe{false};
  double time{0};   // seconds since the start of the stream
  Bytes data;
};

// Packs a run of packets into one self-contained chunk payload.
class ChunkMuxer {
public:
  virtual ~ChunkMuxer() = default;
  virtual Result<void> write(const MediaPacket& packet) = 0;
  virtual Result<Bytes> finish() = 0;
};

// Sequential packet reader over one encoded stream; rewind() starts over.
class PacketSource {
public:
  virtual ~PacketSource() = default;
  virtual Result<std::optional<MediaPacket>> next() = 0;
  virtual Result<void> rewind() = 0;
  // Stream whose keyframes decide where chunks are cut.
  virtual int primaryStream() const = 0;
  virtual Result<std::unique_ptr<ChunkMuxer>> newMuxer() = 0;
};

class EncodedStreamReader {
public:
  virtual ~EncodedStreamReader() = default;
  virtual Result<std::unique_ptr<PacketSource>> open(const EncodedStream& stream) = 0;
};

}
