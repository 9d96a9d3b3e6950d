#pragma once

// project
#include "domain/media_prober.hpp"

namespace pipeline_service {

// Reads container and video stream metadata with libavformat. Only the
// header and the first packets needed by avformat_find_stream_info are read.
class FfmpegMediaProber : public MediaProber {
public:
  Result<SourceProbe> probe(const std::string& source_path) override;
};

} // namespace pipeline_service
