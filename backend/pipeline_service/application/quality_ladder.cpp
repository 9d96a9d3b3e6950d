#include "quality_ladder.hpp"

#include <algorithm>
#include <stdexcept>

namespace pipeline_service {

QualityLadderPlanner::QualityLadderPlanner(const config::QualityLadderConfig& ladder) {
  if (ladder.levels.empty()) {
    throw std::invalid_argument("quality ladder has no levels");
  }
  levels_.reserve(ladder.levels.size());
  for (const auto& l : ladder.levels) {
    levels_.push_back(QualityLevel{
      .label = l.label,
      .width = l.width,
      .height = l.height,
      .bitrate = l.bitrate,
      .fps = l.fps,
      .codec = l.codec,
      .profile = l.profile
    });
  }
  std::stable_sort(levels_.begin(), levels_.end(),
    [](const QualityLevel& a, const QualityLevel& b) { return a.height < b.height; });
}

std::vector<QualityLevel> QualityLadderPlanner::plan(int /*source_width*/, int source_height) const {
  std::vector<QualityLevel> planned;
  for (const auto& level : levels_) {
    if (level.height <= source_height) {
      planned.push_back(level);
    }
  }
  if (planned.empty()) {
    planned.push_back(levels_.front());
  }
  return planned;
}

std::optional<QualityLevel> QualityLadderPlanner::find(const std::string& label) const {
  auto it = std::find_if(levels_.begin(), levels_.end(),
    [&](const QualityLevel& l) { return l.label == label; });
  if (it == levels_.end()) {
    return std::nullopt;
  }
  return *it;
}

} // namespace pipeline_service
