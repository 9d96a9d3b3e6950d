#pragma once

// project
#include "domain/encoded_stream_reader.hpp"
#include "ffmpeg_handles.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace pipeline_service {

// Collects one chunk as a standalone MPEG-TS payload in memory.
class MpegTsChunkMuxer : public ChunkMuxer {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  static Result<std::unique_ptr<MpegTsChunkMuxer>> create(const AVFormatContext* source);
  explicit MpegTsChunkMuxer(PrivateTag) {}
  ~MpegTsChunkMuxer() override;

  Result<void> write(const MediaPacket& packet) override;
  Result<Bytes> finish() override;

private:
#if LIBAVFORMAT_VERSION_MAJOR >= 61
  static int writeThunk(void* opaque, const uint8_t* buf, int buf_size);
#else
  static int writeThunk(void* opaque, uint8_t* buf, int buf_size);
#endif

  AVFormatContext* output_ctx_{nullptr};
  AVIOContext* avio_ctx_{nullptr};
  std::vector<AVRational> source_time_bases_;
  PacketPtr packet_;
  Bytes buffer_;
  bool finished_{false};
};

// Demuxes an encoded MPEG-TS file packet by packet.
class FfmpegPacketSource : public PacketSource {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  static Result<std::unique_ptr<FfmpegPacketSource>> open(const std::filesystem::path& path);
  FfmpegPacketSource(PrivateTag, std::filesystem::path path) : path_(std::move(path)) {}

  Result<std::optional<MediaPacket>> next() override;
  Result<void> rewind() override;
  int primaryStream() const override { return video_stream_idx_; }
  Result<std::unique_ptr<ChunkMuxer>> newMuxer() override;

private:
  Result<void> openInput();

  std::filesystem::path path_;
  InputFormatPtr input_ctx_;
  PacketPtr packet_;
  int video_stream_idx_{-1};
  int64_t video_start_{AV_NOPTS_VALUE};
};

class FfmpegEncodedStreamReader : public EncodedStreamReader {
public:
  Result<std::unique_ptr<PacketSource>> open(const EncodedStream& stream) override;
};

} // namespace pipeline_service
