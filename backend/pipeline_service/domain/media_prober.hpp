#pragma once
#include "video_repository.hpp"
#include <string>

namespace pipeline_service {

class MediaProber {
public:
  virtual ~MediaProber() = default;
  // UnsupportedFormat when the container/codec is not recognised,
  // CorruptInput when the metadata cannot be read.
  virtual Result<SourceProbe> probe(const std::string& source_path) = 0;
};

}
