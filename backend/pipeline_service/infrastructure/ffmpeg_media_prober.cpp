#include "ffmpeg_media_prober.hpp"
#include "ffmpeg_handles.hpp"

#include <filesystem>
#include <format>

namespace pipeline_service {

Result<SourceProbe> FfmpegMediaProber::probe(const std::string& source_path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source_path, ec)) {
    return std::unexpected(corruptInput(std::format("cannot read source {}", source_path)));
  }

  AVFormatContext* raw_ctx = nullptr;
  if (int ret = avformat_open_input(&raw_ctx, source_path.c_str(), nullptr, nullptr); ret < 0) {
    if (ret == AVERROR_INVALIDDATA) {
      return std::unexpected(unsupportedFormat("unrecognized container: " + avErrorString(ret)));
    }
    return std::unexpected(corruptInput("could not open input: " + avErrorString(ret)));
  }
  InputFormatPtr ctx(raw_ctx);

  if (int ret = avformat_find_stream_info(ctx.get(), nullptr); ret < 0) {
    return std::unexpected(corruptInput("could not read stream info: " + avErrorString(ret)));
  }

  int video_idx = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    return std::unexpected(unsupportedFormat(std::format(
      "no video stream in {} container", ctx->iformat->name)));
  }
  AVStream* stream = ctx->streams[video_idx];
  const AVCodecParameters* par = stream->codecpar;

  if (!avcodec_find_decoder(par->codec_id)) {
    return std::unexpected(unsupportedFormat(std::format(
      "no decoder for codec {}", avcodec_get_name(par->codec_id))));
  }
  if (par->width <= 0 || par->height <= 0) {
    return std::unexpected(corruptInput("video stream has no frame size"));
  }

  double duration = 0;
  if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
    duration = static_cast<double>(ctx->duration) / AV_TIME_BASE;
  } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
    duration = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
  }
  if (duration <= 0) {
    return std::unexpected(corruptInput("duration could not be determined"));
  }

  AVRational frame_rate = av_guess_frame_rate(ctx.get(), stream, nullptr);

  SourceProbe probe;
  probe.duration = duration;
  probe.width = par->width;
  probe.height = par->height;
  probe.codec = avcodec_get_name(par->codec_id);
  probe.frame_rate = (frame_rate.num > 0 && frame_rate.den > 0) ? av_q2d(frame_rate) : 0;
  probe.container = ctx->iformat->name;
  probe.has_audio = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0) >= 0;
  probe.file_size = std::filesystem::file_size(source_path, ec);
  return probe;
}

} // namespace pipeline_service
