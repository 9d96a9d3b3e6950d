#include "ffmpeg_thumbnailer.hpp"

#include <algorithm>
#include <cmath>
#include <format>

extern "C" {
  #include <libavutil/avutil.h>
}

namespace pipeline_service {

namespace {

constexpr double kThumbnailAt = 1.0;

struct Box {
  int width;
  int height;
};
constexpr Box kSmall{320, 180};
constexpr Box kMedium{480, 270};
constexpr Box kLarge{640, 360};

int evenDimension(double value) {
  int v = static_cast<int>(std::lround(value));
  return std::max(2, v - v % 2);
}

} // namespace

Result<ThumbnailSet> FfmpegThumbnailer::generate(const std::string& source_path, const SourceProbe& probe) {
  const double at = probe.duration > kThumbnailAt ? kThumbnailAt : 0.0;
  auto frame = grabFrame(source_path, at);
  if (!frame) {
    return std::unexpected(frame.error());
  }

  ThumbnailSet set;
  for (auto [box, target] : {std::pair{kSmall, &set.small},
                             std::pair{kMedium, &set.medium},
                             std::pair{kLarge, &set.large}}) {
    auto jpeg = encodeJpeg(frame->get(), box.width, box.height);
    if (!jpeg) {
      return std::unexpected(jpeg.error());
    }
    *target = std::move(*jpeg);
  }
  return set;
}

Result<FramePtr> FfmpegThumbnailer::grabFrame(const std::string& source_path, double at_seconds) {
  AVFormatContext* raw_ctx = nullptr;
  if (int ret = avformat_open_input(&raw_ctx, source_path.c_str(), nullptr, nullptr); ret < 0) {
    return std::unexpected(corruptInput("Could not open input file: " + avErrorString(ret)));
  }
  InputFormatPtr input(raw_ctx);
  if (avformat_find_stream_info(input.get(), nullptr) < 0) {
    return std::unexpected(corruptInput("Could not find stream info"));
  }
  int video_idx = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    return std::unexpected(unsupportedFormat("Could not find video stream"));
  }
  AVStream* stream = input->streams[video_idx];

  const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
  if (!decoder) {
    return std::unexpected(unsupportedFormat("Failed to find decoder"));
  }
  CodecContextPtr dec(avcodec_alloc_context3(decoder));
  if (!dec || avcodec_parameters_to_context(dec.get(), stream->codecpar) < 0 ||
      avcodec_open2(dec.get(), decoder, nullptr) < 0) {
    return std::unexpected(corruptInput("Failed to open decoder"));
  }

  const int64_t start = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
  const int64_t target = start + av_rescale_q(static_cast<int64_t>(at_seconds * AV_TIME_BASE),
                                              AV_TIME_BASE_Q, stream->time_base);
  if (at_seconds > 0 && av_seek_frame(input.get(), video_idx, target, AVSEEK_FLAG_BACKWARD) < 0) {
    // not seekable, decode forward from the beginning instead
    avcodec_flush_buffers(dec.get());
  }

  PacketPtr packet(av_packet_alloc());
  FramePtr frame(av_frame_alloc());
  FramePtr last;
  if (!packet || !frame) {
    return std::unexpected(transientTranscode("Could not allocate frame or packet"));
  }

  bool draining = false;
  while (true) {
    if (!draining) {
      int ret = av_read_frame(input.get(), packet.get());
      if (ret < 0) {
        draining = true;
        if (avcodec_send_packet(dec.get(), nullptr) < 0) {
          break;
        }
      } else {
        int sent = packet->stream_index == video_idx ? avcodec_send_packet(dec.get(), packet.get()) : 0;
        av_packet_unref(packet.get());
        if (sent < 0 && sent != AVERROR_INVALIDDATA && sent != AVERROR(EAGAIN)) {
          return std::unexpected(corruptInput("Error sending packet to decoder: " + avErrorString(sent)));
        }
      }
    }

    int ret = avcodec_receive_frame(dec.get(), frame.get());
    if (ret == AVERROR(EAGAIN) && !draining) {
      continue;
    }
    if (ret < 0) {
      break;   // EOF or broken stream, fall back to the last good frame
    }
    const int64_t ts = frame->best_effort_timestamp;
    last.reset(av_frame_clone(frame.get()));
    av_frame_unref(frame.get());
    if (ts == AV_NOPTS_VALUE || ts >= target) {
      return last;
    }
  }

  if (!last) {
    return std::unexpected(corruptInput("no decodable video frame"));
  }
  return last;
}

Result<Bytes> FfmpegThumbnailer::encodeJpeg(const AVFrame* frame, int box_width, int box_height) {
  const double scale = std::min(static_cast<double>(box_width) / frame->width,
                                static_cast<double>(box_height) / frame->height);
  const int width = evenDimension(frame->width * scale);
  const int height = evenDimension(frame->height * scale);

  const AVCodec* encoder = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
  if (!encoder) {
    return std::unexpected(permanentTranscode("Failed to find mjpeg encoder"));
  }
  CodecContextPtr enc(avcodec_alloc_context3(encoder));
  if (!enc) {
    return std::unexpected(transientTranscode("Failed to allocate encoder context"));
  }
  enc->width = width;
  enc->height = height;
  enc->pix_fmt = AV_PIX_FMT_YUVJ420P;
  enc->time_base = av_make_q(1, 25);
  enc->flags |= AV_CODEC_FLAG_QSCALE;
  enc->global_quality = FF_QP2LAMBDA * 3;
  if (int ret = avcodec_open2(enc.get(), encoder, nullptr); ret < 0) {
    return std::unexpected(permanentTranscode("Failed to open mjpeg encoder: " + avErrorString(ret)));
  }

  SwsContextPtr sws(sws_getContext(frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
                                   width, height, enc->pix_fmt, SWS_BICUBIC, nullptr, nullptr, nullptr));
  FramePtr scaled(av_frame_alloc());
  if (!sws || !scaled) {
    return std::unexpected(transientTranscode("Could not create scaler"));
  }
  scaled->format = enc->pix_fmt;
  scaled->width = width;
  scaled->height = height;
  if (av_frame_get_buffer(scaled.get(), 0) < 0) {
    return std::unexpected(transientTranscode("Could not allocate scaled frame"));
  }
  sws_scale(sws.get(), frame->data, frame->linesize, 0, frame->height, scaled->data, scaled->linesize);
  scaled->pts = 0;
  scaled->quality = enc->global_quality;

  PacketPtr packet(av_packet_alloc());
  if (!packet) {
    return std::unexpected(transientTranscode("Could not allocate packet"));
  }
  if (int ret = avcodec_send_frame(enc.get(), scaled.get()); ret < 0) {
    return std::unexpected(transientTranscode("Error sending frame to encoder: " + avErrorString(ret)));
  }
  if (int ret = avcodec_send_frame(enc.get(), nullptr); ret < 0) {
    return std::unexpected(transientTranscode("Error flushing encoder: " + avErrorString(ret)));
  }

  Bytes jpeg;
  while (true) {
    int ret = avcodec_receive_packet(enc.get(), packet.get());
    if (ret == AVERROR_EOF || ret == AVERROR(EAGAIN)) {
      break;
    }
    if (ret < 0) {
      return std::unexpected(transientTranscode("Error receiving jpeg: " + avErrorString(ret)));
    }
    jpeg.insert(jpeg.end(), packet->data, packet->data + packet->size);
    av_packet_unref(packet.get());
  }
  if (jpeg.empty()) {
    return std::unexpected(permanentTranscode(std::format("empty {}x{} thumbnail", width, height)));
  }
  return jpeg;
}

} // namespace pipeline_service
