#include "ffmpeg_segment_reader.hpp"

#include <cstring>
#include <format>

extern "C" {
  #include <libavutil/mem.h>
}

namespace pipeline_service {

namespace {
constexpr int kAvioBufferSize = 64 * 1024;
}

// MpegTsChunkMuxer

Result<std::unique_ptr<MpegTsChunkMuxer>> MpegTsChunkMuxer::create(const AVFormatContext* source) {
  auto muxer = std::make_unique<MpegTsChunkMuxer>(PrivateTag{});

  avformat_alloc_output_context2(&muxer->output_ctx_, nullptr, "mpegts", nullptr);
  if (!muxer->output_ctx_) {
    return std::unexpected(permanentTranscode("Could not create chunk muxer"));
  }
  muxer->output_ctx_->flags |= AVFMT_FLAG_BITEXACT;

  for (unsigned int i = 0; i < source->nb_streams; ++i) {
    const AVStream* in = source->streams[i];
    AVStream* out = avformat_new_stream(muxer->output_ctx_, nullptr);
    if (!out) {
      return std::unexpected(transientTranscode("Failed to allocate chunk stream"));
    }
    if (avcodec_parameters_copy(out->codecpar, in->codecpar) < 0) {
      return std::unexpected(transientTranscode("Failed to copy chunk stream parameters"));
    }
    out->codecpar->codec_tag = 0;
    out->time_base = in->time_base;
    muxer->source_time_bases_.push_back(in->time_base);
  }

  auto* buffer = static_cast<unsigned char*>(av_malloc(kAvioBufferSize));
  if (!buffer) {
    return std::unexpected(transientTranscode("Could not allocate AVIO buffer"));
  }
  muxer->avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 1, muxer.get(), nullptr,
                                        &MpegTsChunkMuxer::writeThunk, nullptr);
  if (!muxer->avio_ctx_) {
    av_free(buffer);
    return std::unexpected(transientTranscode("Could not allocate AVIO context"));
  }
  muxer->output_ctx_->pb = muxer->avio_ctx_;
  muxer->output_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  muxer->packet_.reset(av_packet_alloc());
  if (!muxer->packet_) {
    return std::unexpected(transientTranscode("Could not allocate packet"));
  }

  AVDictionary* opts = nullptr;
  av_dict_set(&opts, "mpegts_copyts", "1", 0);
  int ret = avformat_write_header(muxer->output_ctx_, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    return std::unexpected(transientTranscode("Failed to write chunk header: " + avErrorString(ret)));
  }
  return muxer;
}

MpegTsChunkMuxer::~MpegTsChunkMuxer() {
  if (output_ctx_) {
    avformat_free_context(output_ctx_);
  }
  if (avio_ctx_) {
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
  }
}

#if LIBAVFORMAT_VERSION_MAJOR >= 61
int MpegTsChunkMuxer::writeThunk(void* opaque, const uint8_t* buf, int buf_size) {
#else
int MpegTsChunkMuxer::writeThunk(void* opaque, uint8_t* buf, int buf_size) {
#endif
  if (opaque == nullptr || buf_size < 0) {
    return AVERROR(EINVAL);
  }
  auto* muxer = static_cast<MpegTsChunkMuxer*>(opaque);
  muxer->buffer_.insert(muxer->buffer_.end(), buf, buf + buf_size);
  return buf_size;
}

Result<void> MpegTsChunkMuxer::write(const MediaPacket& packet) {
  if (finished_) {
    return std::unexpected(permanentTranscode("chunk already finished"));
  }
  if (packet.stream_index < 0 || packet.stream_index >= static_cast<int>(source_time_bases_.size())) {
    return std::unexpected(permanentTranscode(std::format("unknown stream {}", packet.stream_index)));
  }

  AVPacket* pkt = packet_.get();
  if (int ret = av_new_packet(pkt, static_cast<int>(packet.data.size())); ret < 0) {
    return std::unexpected(transientTranscode("Could not allocate packet: " + avErrorString(ret)));
  }
  if (!packet.data.empty()) {
    std::memcpy(pkt->data, packet.data.data(), packet.data.size());
  }
  pkt->stream_index = packet.stream_index;
  pkt->pts = packet.pts;
  pkt->dts = packet.dts;
  pkt->duration = packet.duration;
  pkt->flags = packet.keyframe ? AV_PKT_FLAG_KEY : 0;
  av_packet_rescale_ts(pkt, source_time_bases_[packet.stream_index],
                       output_ctx_->streams[packet.stream_index]->time_base);

  if (int ret = av_interleaved_write_frame(output_ctx_, pkt); ret < 0) {
    return std::unexpected(transientTranscode("Error writing chunk packet: " + avErrorString(ret)));
  }
  return {};
}

Result<Bytes> MpegTsChunkMuxer::finish() {
  if (finished_) {
    return std::unexpected(permanentTranscode("chunk already finished"));
  }
  finished_ = true;
  if (int ret = av_write_trailer(output_ctx_); ret < 0) {
    return std::unexpected(transientTranscode("Failed to write chunk trailer: " + avErrorString(ret)));
  }
  avio_flush(avio_ctx_);
  return std::move(buffer_);
}

// FfmpegPacketSource

Result<std::unique_ptr<FfmpegPacketSource>> FfmpegPacketSource::open(const std::filesystem::path& path) {
  auto source = std::make_unique<FfmpegPacketSource>(PrivateTag{}, path);
  source->packet_.reset(av_packet_alloc());
  if (!source->packet_) {
    return std::unexpected(transientTranscode("Could not allocate packet"));
  }
  if (auto ret = source->openInput(); !ret) {
    return std::unexpected(ret.error());
  }
  return source;
}

Result<void> FfmpegPacketSource::openInput() {
  input_ctx_.reset();
  AVFormatContext* raw_ctx = nullptr;
  if (int ret = avformat_open_input(&raw_ctx, path_.c_str(), nullptr, nullptr); ret < 0) {
    return std::unexpected(transientTranscode(std::format(
      "Could not open encoded stream {}: {}", path_.string(), avErrorString(ret))));
  }
  input_ctx_.reset(raw_ctx);

  if (int ret = avformat_find_stream_info(input_ctx_.get(), nullptr); ret < 0) {
    return std::unexpected(permanentTranscode("Could not read encoded stream info: " + avErrorString(ret)));
  }
  video_stream_idx_ = av_find_best_stream(input_ctx_.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx_ < 0) {
    return std::unexpected(permanentTranscode("Encoded stream has no video"));
  }
  video_start_ = input_ctx_->streams[video_stream_idx_]->start_time;
  return {};
}

Result<std::optional<MediaPacket>> FfmpegPacketSource::next() {
  int ret = av_read_frame(input_ctx_.get(), packet_.get());
  if (ret == AVERROR_EOF) {
    return std::optional<MediaPacket>{};
  }
  if (ret < 0) {
    return std::unexpected(transientTranscode("Error reading encoded stream: " + avErrorString(ret)));
  }

  const AVStream* stream = input_ctx_->streams[packet_->stream_index];
  MediaPacket packet;
  packet.stream_index = packet_->stream_index;
  packet.pts = packet_->pts;
  packet.dts = packet_->dts;
  packet.duration = packet_->duration;
  packet.keyframe = (packet_->flags & AV_PKT_FLAG_KEY) != 0;

  // chunk cuts are measured on the primary stream's own clock
  int64_t ts = packet_->pts != AV_NOPTS_VALUE ? packet_->pts : packet_->dts;
  if (ts != AV_NOPTS_VALUE) {
    int64_t start = video_start_ != AV_NOPTS_VALUE ? video_start_ : 0;
    if (packet.stream_index != video_stream_idx_ && video_start_ != AV_NOPTS_VALUE) {
      start = av_rescale_q(video_start_, input_ctx_->streams[video_stream_idx_]->time_base,
                           stream->time_base);
    }
    packet.time = static_cast<double>(ts - start) * av_q2d(stream->time_base);
  }
  packet.data.assign(packet_->data, packet_->data + packet_->size);
  av_packet_unref(packet_.get());
  return packet;
}

Result<void> FfmpegPacketSource::rewind() {
  return openInput();
}

Result<std::unique_ptr<ChunkMuxer>> FfmpegPacketSource::newMuxer() {
  auto muxer = MpegTsChunkMuxer::create(input_ctx_.get());
  if (!muxer) {
    return std::unexpected(muxer.error());
  }
  return std::unique_ptr<ChunkMuxer>(std::move(*muxer));
}

// FfmpegEncodedStreamReader

Result<std::unique_ptr<PacketSource>> FfmpegEncodedStreamReader::open(const EncodedStream& stream) {
  if (stream.file.empty()) {
    return std::unexpected(permanentTranscode(std::format("no encoded file for {}", stream.quality)));
  }
  auto source = FfmpegPacketSource::open(stream.file.path());
  if (!source) {
    return std::unexpected(source.error());
  }
  return std::unique_ptr<PacketSource>(std::move(*source));
}

} // namespace pipeline_service
