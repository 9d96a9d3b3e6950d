#include "ffmpeg_transcoder.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

extern "C" {
  #include <libavutil/log.h>
  #include <libavutil/opt.h>
}

namespace pipeline_service {

namespace {

int evenDimension(int value) {
  return std::max(2, value - value % 2);
}

PipelineError timedOut(std::chrono::seconds timeout) {
  return transientTranscode(std::format("encode exceeded {}s", timeout.count()));
}

PipelineError interrupted(const std::stop_token& stop, std::chrono::seconds timeout) {
  if (stop.stop_requested()) {
    return transientTranscode("encode cancelled");
  }
  return timedOut(timeout);
}

} // namespace

FfmpegTranscoder::Context::~Context() {
  if (output_ctx) {
    if (!(output_ctx->oformat->flags & AVFMT_NOFILE)) {
      avio_closep(&output_ctx->pb);
    }
    avformat_free_context(output_ctx);
  }
}

FfmpegTranscoder::FfmpegTranscoder(const config::FFmpegConfig& ffmpeg, std::string temp_dir,
                                   double chunk_seconds, std::chrono::seconds timeout)
  : ffmpeg_(ffmpeg), temp_dir_(std::move(temp_dir)), chunk_seconds_(chunk_seconds), timeout_(timeout) {
  av_log_set_level(ffmpeg_.log_level);
}

int FfmpegTranscoder::interruptCallback(void* opaque) {
  auto* ctx = static_cast<Context*>(opaque);
  if (ctx->stop.stop_requested()) {
    return 1;
  }
  return std::chrono::steady_clock::now() > ctx->deadline ? 1 : 0;
}

Result<EncodedStream> FfmpegTranscoder::transcode(const std::string& source_path,
                                                  const SourceProbe& probe,
                                                  const QualityLevel& target,
                                                  std::stop_token stop) {
  auto file = common::ScopedTempFile::create(temp_dir_, target.label + ENCODED_FILE_SUFFIX, ".ts");
  if (!file) {
    return std::unexpected(transientTranscode(file.error()));
  }

  Context ctx;
  ctx.deadline = std::chrono::steady_clock::now() + timeout_;
  ctx.stop = stop;

  if (auto ret = openInputFile(source_path, ctx); !ret) {
    return std::unexpected(ret.error());
  }
  if (auto ret = openOutputFile(file->path().string(), probe, target, ctx); !ret) {
    return std::unexpected(ret.error());
  }

  AVDictionary* mux_opts = nullptr;
  av_dict_set(&mux_opts, "mpegts_copyts", "1", 0);
  int header = avformat_write_header(ctx.output_ctx, &mux_opts);
  av_dict_free(&mux_opts);
  if (header < 0) {
    return std::unexpected(transientTranscode("Failed to write header: " + avErrorString(header)));
  }

  while (true) {
    if (stop.stop_requested()) {
      return std::unexpected(interrupted(stop, timeout_));
    }
    if (std::chrono::steady_clock::now() > ctx.deadline) {
      return std::unexpected(timedOut(timeout_));
    }
    int ret = av_read_frame(ctx.input_ctx.get(), ctx.packet.get());
    if (ret == AVERROR_EOF) {
      break;
    }
    if (ret == AVERROR_EXIT) {
      return std::unexpected(interrupted(stop, timeout_));
    }
    if (ret < 0) {
      return std::unexpected(transientTranscode("Error reading source: " + avErrorString(ret)));
    }

    if (ctx.packet->stream_index == ctx.video_stream_idx) {
      ret = avcodec_send_packet(ctx.video_dec_ctx.get(), ctx.packet.get());
      av_packet_unref(ctx.packet.get());
      if (ret == AVERROR_INVALIDDATA) {
        continue;   // damaged packet, the decoder resyncs on the next one
      }
      if (ret < 0) {
        return std::unexpected(transientTranscode("Error sending packet to decoder: " + avErrorString(ret)));
      }
      if (auto drained = drainDecoder(ctx); !drained) {
        return std::unexpected(drained.error());
      }
    } else if (ctx.packet->stream_index == ctx.audio_stream_idx && ctx.out_audio) {
      if (auto copied = copyAudioPacket(ctx); !copied) {
        return std::unexpected(copied.error());
      }
    } else {
      av_packet_unref(ctx.packet.get());
    }
  }

  // Flush decoder and encoder
  if (int ret = avcodec_send_packet(ctx.video_dec_ctx.get(), nullptr); ret < 0) {
    return std::unexpected(transientTranscode("Error flushing decoder: " + avErrorString(ret)));
  }
  if (auto drained = drainDecoder(ctx); !drained) {
    return std::unexpected(drained.error());
  }
  if (auto flushed = sendToEncoder(ctx, nullptr); !flushed) {
    return std::unexpected(flushed.error());
  }

  if (int ret = av_write_trailer(ctx.output_ctx); ret < 0) {
    return std::unexpected(transientTranscode("Failed to write trailer: " + avErrorString(ret)));
  }
  avio_closep(&ctx.output_ctx->pb);

  if (ctx.last_index < 0 || ctx.packets_written == 0) {
    return std::unexpected(permanentTranscode(std::format(
      "encoder produced no video for {}", target.label)));
  }
  if (file->size() == 0) {
    return std::unexpected(permanentTranscode(std::format("zero-length output for {}", target.label)));
  }

  EncodedStream stream;
  stream.quality = target.label;
  stream.duration = static_cast<double>(ctx.last_index + 1) / ctx.fps;
  stream.file = std::move(*file);
  std::cout << std::format("[transcoder] {} -> {} ({} bytes, {:.3f}s)",
    source_path, target.debug(), stream.file.size(), stream.duration) << std::endl;
  return stream;
}

Result<void> FfmpegTranscoder::openInputFile(const std::string& input_path, Context& ctx) {
  AVFormatContext* raw_ctx = avformat_alloc_context();
  if (!raw_ctx) {
    return std::unexpected(transientTranscode("Could not allocate input context"));
  }
  raw_ctx->interrupt_callback.callback = &FfmpegTranscoder::interruptCallback;
  raw_ctx->interrupt_callback.opaque = &ctx;
  if (int ret = avformat_open_input(&raw_ctx, input_path.c_str(), nullptr, nullptr); ret < 0) {
    return std::unexpected(transientTranscode("Could not open input file: " + avErrorString(ret)));
  }
  ctx.input_ctx.reset(raw_ctx);

  if (int ret = avformat_find_stream_info(ctx.input_ctx.get(), nullptr); ret < 0) {
    return std::unexpected(transientTranscode("Could not find stream info: " + avErrorString(ret)));
  }
  if (ctx.video_stream_idx = av_find_best_stream(ctx.input_ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
      ctx.video_stream_idx < 0) {
    return std::unexpected(permanentTranscode("Could not find video stream"));
  }
  ctx.video_stream = ctx.input_ctx->streams[ctx.video_stream_idx];

  ctx.audio_stream_idx = av_find_best_stream(ctx.input_ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (ctx.audio_stream_idx >= 0) {
    ctx.audio_stream = ctx.input_ctx->streams[ctx.audio_stream_idx];
  }

  // both tracks are shifted by the container start so the output begins at 0
  const int64_t start = ctx.input_ctx->start_time;
  if (start != AV_NOPTS_VALUE) {
    ctx.video_start = av_rescale_q(start, AV_TIME_BASE_Q, ctx.video_stream->time_base);
    if (ctx.audio_stream) {
      ctx.audio_start = av_rescale_q(start, AV_TIME_BASE_Q, ctx.audio_stream->time_base);
    }
  }

  if (auto ret = initVideoDecoder(ctx); !ret) {
    return ret;
  }

  ctx.frame.reset(av_frame_alloc());
  ctx.scaled.reset(av_frame_alloc());
  ctx.packet.reset(av_packet_alloc());
  ctx.out_packet.reset(av_packet_alloc());
  if (!ctx.frame || !ctx.scaled || !ctx.packet || !ctx.out_packet) {
    return std::unexpected(transientTranscode("Could not allocate frame or packet"));
  }
  return {};
}

Result<void> FfmpegTranscoder::openOutputFile(const std::string& output_path, const SourceProbe& probe,
                                              const QualityLevel& target, Context& ctx) {
  avformat_alloc_output_context2(&ctx.output_ctx, nullptr, "mpegts", output_path.c_str());
  if (!ctx.output_ctx) {
    return std::unexpected(permanentTranscode("Could not create output context"));
  }
  ctx.output_ctx->flags |= AVFMT_FLAG_BITEXACT;

  if (auto ret = initVideoEncoder(probe, target, ctx); !ret) {
    return ret;
  }

  ctx.out_video = avformat_new_stream(ctx.output_ctx, nullptr);
  if (!ctx.out_video) {
    return std::unexpected(transientTranscode("Failed to allocate output stream"));
  }
  if (avcodec_parameters_from_context(ctx.out_video->codecpar, ctx.video_enc_ctx.get()) < 0) {
    return std::unexpected(transientTranscode("Failed to copy encoder parameters to output stream"));
  }
  ctx.out_video->time_base = ctx.video_enc_ctx->time_base;

  if (ctx.audio_stream) {
    ctx.out_audio = avformat_new_stream(ctx.output_ctx, nullptr);
    if (!ctx.out_audio) {
      return std::unexpected(transientTranscode("Failed to allocate audio output stream"));
    }
    if (avcodec_parameters_copy(ctx.out_audio->codecpar, ctx.audio_stream->codecpar) < 0) {
      return std::unexpected(transientTranscode("Failed to copy audio parameters"));
    }
    ctx.out_audio->codecpar->codec_tag = 0;
    ctx.out_audio->time_base = ctx.audio_stream->time_base;
  }

  if (!(ctx.output_ctx->oformat->flags & AVFMT_NOFILE)) {
    if (int ret = avio_open(&ctx.output_ctx->pb, output_path.c_str(), AVIO_FLAG_WRITE); ret < 0) {
      return std::unexpected(transientTranscode("Could not open output file: " + avErrorString(ret)));
    }
  }
  return {};
}

Result<void> FfmpegTranscoder::initVideoDecoder(Context& ctx) {
  const AVCodec* decoder = avcodec_find_decoder(ctx.video_stream->codecpar->codec_id);
  if (!decoder) {
    return std::unexpected(permanentTranscode("Failed to find decoder"));
  }
  ctx.video_dec_ctx.reset(avcodec_alloc_context3(decoder));
  if (!ctx.video_dec_ctx) {
    return std::unexpected(transientTranscode("Failed to allocate decoder context"));
  }
  if (avcodec_parameters_to_context(ctx.video_dec_ctx.get(), ctx.video_stream->codecpar) < 0) {
    return std::unexpected(transientTranscode("Failed to copy decoder params"));
  }
  ctx.video_dec_ctx->pkt_timebase = ctx.video_stream->time_base;
  if (int ret = avcodec_open2(ctx.video_dec_ctx.get(), decoder, nullptr); ret < 0) {
    return std::unexpected(permanentTranscode("Failed to open decoder: " + avErrorString(ret)));
  }
  return {};
}

Result<void> FfmpegTranscoder::initVideoEncoder(const SourceProbe& probe, const QualityLevel& target,
                                                Context& ctx) {
  const std::string codec_lib = target.codec.empty() ? ffmpeg_.codec_lib : target.codec;
  const AVCodec* encoder = avcodec_find_encoder_by_name(codec_lib.c_str());
  if (!encoder) {
    return std::unexpected(permanentTranscode("Failed to find encoder: " + codec_lib));
  }

  ctx.video_enc_ctx.reset(avcodec_alloc_context3(encoder));
  if (!ctx.video_enc_ctx) {
    return std::unexpected(transientTranscode("Failed to allocate encoder context"));
  }
  auto* enc = ctx.video_enc_ctx.get();

  // never raise the frame rate above the source
  ctx.fps = target.fps > 0 ? target.fps : 30;
  if (probe.frame_rate > 0 && probe.frame_rate < ctx.fps) {
    ctx.fps = std::max(1, static_cast<int>(std::lround(probe.frame_rate)));
  }

  enc->width = evenDimension(target.width);
  enc->height = evenDimension(target.height);
  enc->sample_aspect_ratio = av_make_q(1, 1);
  enc->bit_rate = target.bitrate;
  enc->rc_max_rate = target.bitrate;
  enc->rc_buffer_size = static_cast<int>(std::min<long>(target.bitrate * 2, INT32_MAX));
  enc->time_base = av_make_q(1, ctx.fps);
  enc->framerate = av_make_q(ctx.fps, 1);
  enc->gop_size = std::max(1, static_cast<int>(std::lround(ctx.fps * chunk_seconds_)));
  enc->max_b_frames = 0;
  enc->pix_fmt = AV_PIX_FMT_YUV420P;

  if (codec_lib == "libx264") {
    av_opt_set(enc->priv_data, "preset", ffmpeg_.preset.c_str(), 0);
    if (!target.profile.empty()) {
      av_opt_set(enc->priv_data, "profile", target.profile.c_str(), 0);
    }
    // forced I frames become IDR so every chunk starts decodable
    av_opt_set(enc->priv_data, "forced-idr", "1", 0);
    av_opt_set(enc->priv_data, "sc_threshold", "0", 0);
  }

  if (ctx.output_ctx->oformat->flags & AVFMT_GLOBALHEADER) {
    enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  if (int ret = avcodec_open2(enc, encoder, nullptr); ret < 0) {
    return std::unexpected(permanentTranscode("Failed to open encoder: " + avErrorString(ret)));
  }

  ctx.scaled->format = enc->pix_fmt;
  ctx.scaled->width = enc->width;
  ctx.scaled->height = enc->height;
  if (int ret = av_frame_get_buffer(ctx.scaled.get(), 0); ret < 0) {
    return std::unexpected(transientTranscode("Could not allocate scaled frame: " + avErrorString(ret)));
  }
  return {};
}

Result<void> FfmpegTranscoder::drainDecoder(Context& ctx) {
  while (true) {
    int ret = avcodec_receive_frame(ctx.video_dec_ctx.get(), ctx.frame.get());
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return {};
    }
    if (ret < 0) {
      return std::unexpected(transientTranscode("Error receiving frame from decoder: " + avErrorString(ret)));
    }
    auto encoded = encodeFrame(ctx, ctx.frame.get());
    av_frame_unref(ctx.frame.get());
    if (!encoded) {
      return encoded;
    }
  }
}

Result<void> FfmpegTranscoder::encodeFrame(Context& ctx, const AVFrame* frame) {
  int64_t ts = frame->best_effort_timestamp;
  if (ts == AV_NOPTS_VALUE) {
    ts = frame->pts;
  }
  int64_t index = ctx.last_index + 1;
  if (ts != AV_NOPTS_VALUE) {
    const double t = static_cast<double>(ts - ctx.video_start) * av_q2d(ctx.video_stream->time_base);
    index = std::llround(t * ctx.fps);
  }
  if (index <= ctx.last_index) {
    return {};   // dropped by the frame rate conversion
  }

  auto* enc = ctx.video_enc_ctx.get();
  ctx.sws_ctx.reset(sws_getCachedContext(ctx.sws_ctx.release(),
    frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
    enc->width, enc->height, enc->pix_fmt, SWS_BICUBIC, nullptr, nullptr, nullptr));
  if (!ctx.sws_ctx) {
    return std::unexpected(permanentTranscode("Could not create scaler"));
  }
  if (int ret = av_frame_make_writable(ctx.scaled.get()); ret < 0) {
    return std::unexpected(transientTranscode("Scaled frame not writable: " + avErrorString(ret)));
  }
  sws_scale(ctx.sws_ctx.get(), frame->data, frame->linesize, 0, frame->height,
            ctx.scaled->data, ctx.scaled->linesize);

  ctx.scaled->pts = index;
  const double out_time = static_cast<double>(index) / ctx.fps;
  const double half_frame = 0.5 / ctx.fps;
  if (out_time + half_frame >= ctx.next_keyframe) {
    ctx.scaled->pict_type = AV_PICTURE_TYPE_I;
    while (ctx.next_keyframe <= out_time + half_frame) {
      ctx.next_keyframe += chunk_seconds_;
    }
  } else {
    ctx.scaled->pict_type = AV_PICTURE_TYPE_NONE;
  }
  ctx.last_index = index;

  return sendToEncoder(ctx, ctx.scaled.get());
}

Result<void> FfmpegTranscoder::sendToEncoder(Context& ctx, AVFrame* frame) {
  if (int ret = avcodec_send_frame(ctx.video_enc_ctx.get(), frame); ret < 0 && ret != AVERROR_EOF) {
    return std::unexpected(transientTranscode("Error sending frame to encoder: " + avErrorString(ret)));
  }

  while (true) {
    int ret = avcodec_receive_packet(ctx.video_enc_ctx.get(), ctx.out_packet.get());
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return {};
    }
    if (ret < 0) {
      return std::unexpected(transientTranscode("Error receiving packet from encoder: " + avErrorString(ret)));
    }

    av_packet_rescale_ts(ctx.out_packet.get(), ctx.video_enc_ctx->time_base, ctx.out_video->time_base);
    ctx.out_packet->stream_index = ctx.out_video->index;
    if (ret = av_interleaved_write_frame(ctx.output_ctx, ctx.out_packet.get()); ret < 0) {
      return std::unexpected(transientTranscode("Error writing output packet: " + avErrorString(ret)));
    }
    ++ctx.packets_written;
  }
}

Result<void> FfmpegTranscoder::copyAudioPacket(Context& ctx) {
  AVPacket* pkt = ctx.packet.get();
  if (pkt->pts != AV_NOPTS_VALUE) pkt->pts -= ctx.audio_start;
  if (pkt->dts != AV_NOPTS_VALUE) pkt->dts -= ctx.audio_start;
  av_packet_rescale_ts(pkt, ctx.audio_stream->time_base, ctx.out_audio->time_base);
  pkt->stream_index = ctx.out_audio->index;
  pkt->pos = -1;

  if (int ret = av_interleaved_write_frame(ctx.output_ctx, pkt); ret < 0) {
    return std::unexpected(transientTranscode("Error writing audio packet: " + avErrorString(ret)));
  }
  return {};
}

} // namespace pipeline_service
