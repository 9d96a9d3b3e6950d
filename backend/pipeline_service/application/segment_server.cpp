#include "segment_server.hpp"

#include <charconv>
#include <format>

namespace pipeline_service {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

std::optional<std::uint64_t> parseNumber(std::string_view s) {
  if (s.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::string SegmentResponse::contentRange() const {
  if (!range) {
    return std::format("bytes */{}", total_length);
  }
  return std::format("bytes {}-{}/{}", range->first, range->second, total_length);
}

std::optional<ByteRange> parseRangeHeader(std::string_view header) {
  header = trim(header);
  constexpr std::string_view kUnit = "bytes=";
  if (!header.starts_with(kUnit)) {
    return std::nullopt;
  }
  auto ranges = trim(header.substr(kUnit.size()));
  if (ranges.find(',') != std::string_view::npos) {
    return std::nullopt;   // multipart ranges are not served
  }
  auto dash = ranges.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }
  auto first_text = trim(ranges.substr(0, dash));
  auto last_text = trim(ranges.substr(dash + 1));

  ByteRange range;
  if (first_text.empty()) {
    range.last = parseNumber(last_text);
    if (!range.last) {
      return std::nullopt;
    }
    return range;
  }
  range.first = parseNumber(first_text);
  if (!range.first) {
    return std::nullopt;
  }
  if (!last_text.empty()) {
    range.last = parseNumber(last_text);
    if (!range.last || *range.last < *range.first) {
      return std::nullopt;
    }
  }
  return range;
}

SegmentServer::SegmentServer(std::shared_ptr<BinaryStore> store) : store_(std::move(store)) {}

Result<SegmentResponse> SegmentServer::serve(const std::string& video_id, const std::string& quality,
                                             int index,
                                             std::optional<std::string_view> range_header) const {
  std::optional<ByteRange> range;
  if (range_header) {
    range = parseRangeHeader(*range_header);
  }

  SegmentResponse response;
  if (range) {
    auto slice = store_->getSegmentRange(video_id, quality, index, *range);
    if (!slice) {
      return std::unexpected(slice.error());
    }
    response.total_length = slice->total;
    response.range = std::make_pair(slice->first, slice->last);
    response.payload = std::move(slice->data);
    return response;
  }

  auto segment = store_->getSegment(video_id, quality, index);
  if (!segment) {
    return std::unexpected(segment.error());
  }
  response.total_length = segment->payload.size();
  response.payload = std::move(segment->payload);
  return response;
}

} // namespace pipeline_service
