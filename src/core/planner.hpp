// core/planner.hpp - Link planning
#pragma once

#include "family.hpp"
#include "inventory.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

namespace protonlink {

struct LinkPlan {
  // Slots missing from the map must end up empty
  std::map<LinkSlot, fs::path> targets;

  bool assigns(LinkSlot slot) const { return targets.count(slot) != 0; }
  std::optional<fs::path> target_of(LinkSlot slot) const;
  bool is_target(const fs::path &path) const;
};

// Candidates sorted newest first
std::vector<ReleaseCandidate>
rank_candidates(std::vector<ReleaseCandidate> candidates);

LinkPlan generate_plan(const std::vector<ReleaseCandidate> &candidates);

} // namespace protonlink
