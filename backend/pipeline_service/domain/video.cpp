#include "video.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace pipeline_service {

namespace {

constexpr std::array<std::pair<VideoStatus, std::string_view>, 6> kVideoStatusNames{{
  {VideoStatus::Uploaded, "uploaded"},
  {VideoStatus::Analyzing, "analyzing"},
  {VideoStatus::Processing, "processing"},
  {VideoStatus::Ready, "ready"},
  {VideoStatus::PartiallyReady, "partially_ready"},
  {VideoStatus::Failed, "failed"},
}};

constexpr std::array<std::pair<RenditionStatus, std::string_view>, 5> kRenditionStatusNames{{
  {RenditionStatus::Pending, "pending"},
  {RenditionStatus::Encoding, "encoding"},
  {RenditionStatus::Segmenting, "segmenting"},
  {RenditionStatus::Ready, "ready"},
  {RenditionStatus::Failed, "failed"},
}};

constexpr std::array<std::pair<Visibility, std::string_view>, 2> kVisibilityNames{{
  {Visibility::Public, "public"},
  {Visibility::Private, "private"},
}};

constexpr std::array<std::pair<ThumbnailSize, std::string_view>, 3> kThumbnailSizeNames{{
  {ThumbnailSize::Small, "small"},
  {ThumbnailSize::Medium, "medium"},
  {ThumbnailSize::Large, "large"},
}};

template <typename Enum, size_t N>
std::string_view nameOf(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value) {
  for (const auto& [e, name] : table) {
    if (e == value) return name;
  }
  return "unknown";
}

template <typename Enum, size_t N>
std::optional<Enum> valueOf(const std::array<std::pair<Enum, std::string_view>, N>& table, std::string_view text) {
  for (const auto& [e, name] : table) {
    if (name == text) return e;
  }
  return std::nullopt;
}

} // namespace

std::string_view toString(VideoStatus status) { return nameOf(kVideoStatusNames, status); }
std::string_view toString(RenditionStatus status) { return nameOf(kRenditionStatusNames, status); }
std::string_view toString(Visibility visibility) { return nameOf(kVisibilityNames, visibility); }
std::string_view toString(ThumbnailSize size) { return nameOf(kThumbnailSizeNames, size); }

std::optional<VideoStatus> parseVideoStatus(std::string_view text) { return valueOf(kVideoStatusNames, text); }
std::optional<RenditionStatus> parseRenditionStatus(std::string_view text) { return valueOf(kRenditionStatusNames, text); }
std::optional<Visibility> parseVisibility(std::string_view text) { return valueOf(kVisibilityNames, text); }
std::optional<ThumbnailSize> parseThumbnailSize(std::string_view text) { return valueOf(kThumbnailSizeNames, text); }

bool isTerminal(VideoStatus status) {
  return status == VideoStatus::Ready || status == VideoStatus::PartiallyReady ||
         status == VideoStatus::Failed;
}

bool isTerminal(RenditionStatus status) {
  return status == RenditionStatus::Ready || status == RenditionStatus::Failed;
}

VideoStatus reconcileVideoStatus(std::span<const RenditionStatus> renditions) {
  const auto ready = std::count(renditions.begin(), renditions.end(), RenditionStatus::Ready);
  if (ready == 0) {
    return VideoStatus::Failed;
  }
  if (static_cast<size_t>(ready) == renditions.size()) {
    return VideoStatus::Ready;
  }
  return VideoStatus::PartiallyReady;
}

const Bytes& ThumbnailSet::get(ThumbnailSize size) const {
  switch (size) {
    case ThumbnailSize::Small:  return small;
    case ThumbnailSize::Medium: return medium;
    case ThumbnailSize::Large:  return large;
  }
  return large;
}

} // namespace pipeline_service
