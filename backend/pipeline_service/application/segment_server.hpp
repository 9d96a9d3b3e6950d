#pragma once

#include "binary_store.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pipeline_service {

inline constexpr std::string_view kSegmentContentType = "video/MP2T";

struct SegmentResponse {
  Bytes payload;
  std::string content_type{kSegmentContentType};
  std::uint64_t total_length{0};
  // set for partial content, inclusive positions inside the segment
  std::optional<std::pair<std::uint64_t, std::uint64_t>> range;

  bool partial() const { return range.has_value(); }
  std::string contentRange() const;
};

// Parses a Range header value ("bytes=0-99", "bytes=100-", "bytes=-50").
// nullopt when the header is not a single well formed byte range.
std::optional<ByteRange> parseRangeHeader(std::string_view header);

class SegmentServer {
public:
  explicit SegmentServer(std::shared_ptr<BinaryStore> store);

  // Whole segment, or a part of it when `range_header` is a valid range.
  // A malformed header is ignored and the whole segment is returned.
  Result<SegmentResponse> serve(const std::string& video_id, const std::string& quality, int index,
                                std::optional<std::string_view> range_header = std::nullopt) const;

private:
  std::shared_ptr<BinaryStore> store_;
};

} // namespace pipeline_service
