// core/links.cpp - Link management entry points implementation
#include "links.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include "planner.hpp"

namespace protonlink {

static void log_outcomes(const ReconcileResult &result) {
  for (const auto &out : result.outcomes) {
    std::string name = out.link.filename().string();
    switch (out.status) {
    case SlotStatus::Ok:
      LOG_INFO(name + ": ok -> " + out.target.filename().string() +
                (out.changed ? "" : " (unchanged)"));
      break;
    case SlotStatus::Removed:
      LOG_INFO(name + ": unassigned" + (out.changed ? " (removed)" : ""));
      break;
    case SlotStatus::Failed:
      // Already reported at ERROR by the reconciler
      break;
    }
  }

  if (result.failure_count() > 0) {
    LOG_WARN(std::to_string(result.failure_count()) +
             " link(s) could not be updated");
  }
}

ReconcileResult manage_links(FileSystem &fsys, const fs::path &root,
                             ReleaseFamily family,
                             const std::optional<std::string> &manual_tag,
                             const ScanOptions &options) {
  auto candidates = scan_candidates(fsys, root, family, manual_tag, options);
  if (candidates.empty()) {
    LOG_WARN("No extracted " + family_to_string(family) + " directories found in " +
             root.string());
  }

  auto plan = generate_plan(candidates);
  auto result = reconcile(fsys, root, family, plan);
  log_outcomes(result);
  return result;
}

ReconcileResult relink(FileSystem &fsys, const fs::path &root,
                       ReleaseFamily family, const ScanOptions &options) {
  auto candidates = scan_candidates(fsys, root, family, std::nullopt, options);
  if (candidates.empty()) {
    throw NoCandidatesError("No installed " + family_to_string(family) +
                            " releases in " + root.string());
  }

  auto result = reconcile(fsys, root, family, generate_plan(candidates));
  log_outcomes(result);
  return result;
}

std::vector<LinkInfo> list_links(FileSystem &fsys, const fs::path &root,
                                 ReleaseFamily family) {
  std::vector<LinkInfo> links;
  for (auto slot : ALL_SLOTS) {
    LinkInfo info{slot, link_name(family, slot), std::nullopt};
    auto binding = read_binding(fsys, root / info.name);
    if (binding.kind == BindingKind::Bound) {
      info.target = binding.target;
    }
    links.push_back(info);
  }
  return links;
}

static fs::path find_installed_release(FileSystem &fsys, const fs::path &root,
                                       ReleaseFamily family,
                                       const std::string &tag) {
  auto dirs = expected_directories(root, family, tag);
  for (const auto &dir : dirs) {
    auto state = fsys.probe(dir);
    if (state.is_real_directory()) {
      return dir;
    }
    if (state.is_symlink()) {
      throw DiscoveryError(dir.string() + " is a link, not an installed release");
    }
  }
  throw DiscoveryError("Release directory does not exist: " + dirs[0].string());
}

ReconcileResult remove_release(FileSystem &fsys, const fs::path &root,
                               ReleaseFamily family, const std::string &tag,
                               const ScanOptions &options) {
  auto release = find_installed_release(fsys, root, family, tag);
  auto release_canonical = fsys.canonical(release);

  // Slots pointing at the release, or already dangling
  std::vector<fs::path> stale_links;
  for (auto slot : ALL_SLOTS) {
    auto link = root / link_name(family, slot);
    auto binding = read_binding(fsys, link);
    if (binding.kind == BindingKind::Broken ||
        (binding.kind == BindingKind::Bound &&
         binding.target == release_canonical)) {
      stale_links.push_back(link);
    }
  }

  try {
    fsys.remove_all(release);
    LOG_INFO("Removed release directory: " + release.string());
  } catch (const std::exception &e) {
    throw LinkError("Failed to remove release directory " + release.string() +
                    ": " + e.what());
  }

  for (const auto &link : stale_links) {
    try {
      fsys.remove_symlink(link);
      LOG_INFO("Removed symbolic link: " + link.string());
    } catch (const std::exception &e) {
      LOG_ERROR("Failed to remove symbolic link " + link.string() + ": " +
                e.what());
    }
  }

  return manage_links(fsys, root, family, std::nullopt, options);
}

} // namespace protonlink
