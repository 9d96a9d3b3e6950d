#pragma once

// project
#include "domain/transcoding_service.hpp"
#include "common/config/config.hpp"
#include "ffmpeg_handles.hpp"

// std
#include <chrono>
#include <cstdint>
#include <string>

namespace pipeline_service {

/*
  source -> decode -> swscale -> encode (libx264 by default) -> MPEG-TS temp file
  Audio packets are copied into the output untouched. A keyframe is forced at
  every chunk boundary so the segmenter can cut exactly there.
*/
class FfmpegTranscoder : public TranscodingService {
public:
  // AV_LOG_QUIET   = -8
  // AV_LOG_ERROR   = 16
  // AV_LOG_WARNING = 24
  // AV_LOG_INFO    = 32
  FfmpegTranscoder(const config::FFmpegConfig& ffmpeg, std::string temp_dir,
                   double chunk_seconds, std::chrono::seconds timeout);

  Result<EncodedStream> transcode(const std::string& source_path,
                                  const SourceProbe& probe,
                                  const QualityLevel& target,
                                  std::stop_token stop) override;

  struct Context {
    InputFormatPtr input_ctx;
    AVFormatContext* output_ctx{nullptr};
    CodecContextPtr video_dec_ctx;
    CodecContextPtr video_enc_ctx;
    SwsContextPtr sws_ctx;
    FramePtr frame;
    FramePtr scaled;
    PacketPtr packet;
    PacketPtr out_packet;
    AVStream* video_stream{nullptr};
    AVStream* audio_stream{nullptr};
    AVStream* out_video{nullptr};
    AVStream* out_audio{nullptr};
    int video_stream_idx{-1};
    int audio_stream_idx{-1};
    int64_t video_start{0};
    int64_t audio_start{0};
    int fps{30};
    int64_t last_index{-1};
    double next_keyframe{0};
    int64_t packets_written{0};
    std::chrono::steady_clock::time_point deadline;
    std::stop_token stop;

    Context() = default;
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    ~Context();
  };

private:
  Result<void> openInputFile(const std::string& input_path, Context& ctx);
  Result<void> openOutputFile(const std::string& output_path, const SourceProbe& probe,
                              const QualityLevel& target, Context& ctx);
  Result<void> initVideoDecoder(Context& ctx);
  Result<void> initVideoEncoder(const SourceProbe& probe, const QualityLevel& target, Context& ctx);
  Result<void> drainDecoder(Context& ctx);
  Result<void> encodeFrame(Context& ctx, const AVFrame* frame);
  Result<void> sendToEncoder(Context& ctx, AVFrame* frame);
  Result<void> copyAudioPacket(Context& ctx);
  static int interruptCallback(void* opaque);

  config::FFmpegConfig ffmpeg_;
  std::string temp_dir_;
  double chunk_seconds_;
  std::chrono::seconds timeout_;
};

} // namespace pipeline_service
