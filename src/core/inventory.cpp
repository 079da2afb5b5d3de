// core/inventory.cpp - Installed release discovery implementation
#include "inventory.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <map>
#include <tuple>

namespace protonlink {

std::string tag_for_directory(const std::string &dir_name,
                              ReleaseFamily family) {
  std::string prefix = describe(family).dir_prefix;
  if (!prefix.empty() && starts_with(dir_name, prefix)) {
    return dir_name.substr(prefix.size());
  }
  return dir_name;
}

void validate_tag(const std::string &tag) {
  if (tag.empty() || tag == "." || tag == ".." ||
      tag.find('/') != std::string::npos || fs::path(tag).is_absolute()) {
    throw DiscoveryError("Invalid release tag: '" + tag + "'");
  }
}

std::vector<fs::path> expected_directories(const fs::path &root,
                                           ReleaseFamily family,
                                           const std::string &tag) {
  validate_tag(tag);
  std::vector<fs::path> dirs = {root / tag};
  std::string prefix = describe(family).dir_prefix;
  if (!prefix.empty()) {
    dirs.push_back(root / (prefix + tag));
  }
  return dirs;
}

fs::path find_tag_directory(FileSystem &fsys, const fs::path &root,
                            const std::string &tag, ReleaseFamily family) {
  auto tried = expected_directories(root, family, tag);

  for (const auto &path : tried) {
    if (fsys.probe(path).is_real_directory()) {
      return path;
    }
  }

  std::string msg = "Manual release directory not found: " + tried[0].string();
  if (tried.size() > 1) {
    msg += " or " + tried[1].string();
  }
  throw DiscoveryError(msg);
}

std::vector<ReleaseCandidate>
deduplicate_candidates(const std::vector<ReleaseCandidate> &candidates,
                       ReleaseFamily family) {
  std::string prefix = describe(family).dir_prefix;
  auto preference = [&prefix](const fs::path &p) {
    std::string name = p.filename().string();
    bool prefixed = !prefix.empty() && starts_with(name, prefix);
    return std::make_tuple(prefixed ? 1 : 0, name.size(), name);
  };

  std::map<VersionKey, fs::path> groups;
  for (const auto &c : candidates) {
    auto it = groups.find(c.key);
    if (it == groups.end()) {
      groups.emplace(c.key, c.path);
    } else if (preference(c.path) < preference(it->second)) {
      LOG_DEBUG("Duplicate version " + c.key.to_string() + ": preferring " +
                c.path.filename().string() + " over " +
                it->second.filename().string());
      it->second = c.path;
    } else {
      LOG_DEBUG("Duplicate version " + c.key.to_string() + ": ignoring " +
                c.path.filename().string());
    }
  }

  std::vector<ReleaseCandidate> unique;
  unique.reserve(groups.size());
  for (const auto &[key, path] : groups) {
    unique.push_back({key, path});
  }
  return unique;
}

std::vector<ReleaseCandidate>
scan_candidates(FileSystem &fsys, const fs::path &root, ReleaseFamily family,
                const std::optional<std::string> &manual_tag,
                const ScanOptions &options) {
  auto root_state = fsys.probe(root);
  if (!root_state.is_real_directory() &&
      !(root_state.is_symlink() && root_state.resolves)) {
    throw LinkError("Release directory does not exist: " + root.string());
  }

  std::vector<fs::path> entries;
  try {
    entries = fsys.list_directory(root);
  } catch (const fs::filesystem_error &e) {
    throw LinkError("Cannot list " + root.string() + ": " + e.what());
  }

  std::vector<ReleaseCandidate> candidates;
  for (const auto &entry : entries) {
    // Symlinks are never releases, including our own slots
    if (!fsys.probe(entry).is_real_directory()) {
      continue;
    }

    std::string tag = tag_for_directory(entry.filename().string(), family);
    if (options.strict_names && !matches_grammar(tag, family)) {
      LOG_DEBUG("Skipping " + entry.filename().string() + " (not a " +
                family_to_string(family) + " release)");
      continue;
    }

    candidates.push_back({parse_version(tag, family), entry});
  }

  if (manual_tag) {
    fs::path manual_dir = find_tag_directory(fsys, root, *manual_tag, family);
    bool known = std::any_of(
        candidates.begin(), candidates.end(),
        [&manual_dir](const ReleaseCandidate &c) {
          return c.path.lexically_normal() == manual_dir.lexically_normal();
        });
    if (!known) {
      LOG_DEBUG("Adding manual release " + manual_dir.string());
      candidates.push_back({parse_version(*manual_tag, family), manual_dir});
    }
  }

  candidates = deduplicate_candidates(candidates, family);
  LOG_DEBUG("Found " + std::to_string(candidates.size()) + " " +
            family_to_string(family) + " candidates in " + root.string());
  return candidates;
}

} // namespace protonlink
