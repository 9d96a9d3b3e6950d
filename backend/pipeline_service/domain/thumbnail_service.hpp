#pragma once
#include "video_repository.hpp"
#include <string>

namespace pipeline_service {
class ThumbnailService {
public:
  virtual ~ThumbnailService() = default;
  virtual Result<ThumbnailSet> generate(const std::string& source_path, const SourceProbe& probe) = 0;
};
}
