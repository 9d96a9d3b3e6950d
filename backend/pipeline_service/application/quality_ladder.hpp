#pragma once

#include "domain/video.hpp"
#include "common/config/config.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pipeline_service {

// Picks the renditions to produce for a source. The ladder table is fixed at
// construction; the same source height always yields the same plan.
class QualityLadderPlanner {
public:
  explicit QualityLadderPlanner(const config::QualityLadderConfig& ladder);

  // Every level no taller than the source, ascending. The lowest level is
  // always included so there is at least one target.
  std::vector<QualityLevel> plan(int source_width, int source_height) const;

  std::optional<QualityLevel> find(const std::string& label) const;
  const std::vector<QualityLevel>& levels() const { return levels_; }

private:
  std::vector<QualityLevel> levels_;
};

} // namespace pipeline_service
