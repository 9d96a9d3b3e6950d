#pragma once

namespace pipeline_service {
class StreamingService {
public:
  virtual ~StreamingService() = default;
  // Blocks serving playlists and segments until stopServer().
  virtual void startServer() = 0;
  virtual void stopServer() = 0;
};
}
