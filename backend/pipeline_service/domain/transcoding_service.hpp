#pragma once
#include "video_repository.hpp"
#include "common/util/scoped_temp_file.hpp"
#include <stop_token>
#include <string>

namespace pipeline_service {

// Output of one transcode: the rendition's encoded stream, parked in a temp
// file owned by whoever holds this object.
struct EncodedStream {
  std::string quality;
  common::ScopedTempFile file;
  double duration{0};   // seconds of media in the stream
};

class TranscodingService {
public:
  virtual ~TranscodingService() = default;
  // Fails with TranscodeTransient (crash, resources, timeout) or
  // TranscodePermanent (unsupported encoder, empty output). A stop request
  // abandons the encode with TranscodeTransient.
  virtual Result<EncodedStream> transcode(const std::string& source_path,
                                          const SourceProbe& probe,
                                          const QualityLevel& target,
                                          std::stop_token stop) = 0;
};
}
