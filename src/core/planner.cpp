// core/planner.cpp - Link planning implementation
#include "planner.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <algorithm>

namespace protonlink {

std::optional<fs::path> LinkPlan::target_of(LinkSlot slot) const {
  auto it = targets.find(slot);
  if (it == targets.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool LinkPlan::is_target(const fs::path &path) const {
  auto wanted = path.lexically_normal();
  return std::any_of(targets.begin(), targets.end(), [&wanted](const auto &t) {
    return t.second.lexically_normal() == wanted;
  });
}

std::vector<ReleaseCandidate>
rank_candidates(std::vector<ReleaseCandidate> candidates) {
  std::sort(candidates.begin(), candidates.end(),
            [](const ReleaseCandidate &a, const ReleaseCandidate &b) {
              int cmp = compare_versions(a.key, b.key);
              if (cmp != 0) {
                return cmp > 0;
              }
              return a.path < b.path;
            });
  return candidates;
}

LinkPlan generate_plan(const std::vector<ReleaseCandidate> &candidates) {
  LinkPlan plan;
  auto ranked = rank_candidates(candidates);

  for (size_t i = 0; i < ranked.size() && i < static_cast<size_t>(SLOT_COUNT);
       ++i) {
    LinkSlot slot = ALL_SLOTS[i];
    plan.targets[slot] = ranked[i].path;
    LOG_DEBUG("Plan: " + slot_to_string(slot) + " -> " +
              ranked[i].path.filename().string() + " " +
              ranked[i].key.to_string());
  }

  return plan;
}

} // namespace protonlink
