#pragma once

#include "domain/thumbnail_service.hpp"
#include "ffmpeg_handles.hpp"

namespace pipeline_service {

// JPEG stills from one frame of the source (t = 1s, or the first frame of
// shorter clips), fitted inside each of the three thumbnail boxes.
class FfmpegThumbnailer : public ThumbnailService {
public:
  Result<ThumbnailSet> generate(const std::string& source_path, const SourceProbe& probe) override;

private:
  Result<FramePtr> grabFrame(const std::string& source_path, double at_seconds);
  Result<Bytes> encodeJpeg(const AVFrame* frame, int box_width, int box_height);
};

} // namespace pipeline_service
