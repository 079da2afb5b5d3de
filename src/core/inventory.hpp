// core/inventory.hpp - Installed release discovery
#pragma once

#include "family.hpp"
#include "filesystem.hpp"
#include "version.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace protonlink {

struct ReleaseCandidate {
  VersionKey key;
  fs::path path;
};

struct ScanOptions {
  // Keep only directories whose name is a well-formed tag of the family
  bool strict_names = false;
};

// Name to parse for an on-disk directory (family prefix stripped)
std::string tag_for_directory(const std::string &dir_name,
                              ReleaseFamily family);

// Throws DiscoveryError unless tag is a single directory name below the root
void validate_tag(const std::string &tag);

// Directories the extractor may produce for tag, in lookup order
std::vector<fs::path> expected_directories(const fs::path &root,
                                           ReleaseFamily family,
                                           const std::string &tag);

// Directory holding a manually requested release; throws DiscoveryError
fs::path find_tag_directory(FileSystem &fsys, const fs::path &root,
                            const std::string &tag, ReleaseFamily family);

// One candidate per version key, preferring canonical directory names
std::vector<ReleaseCandidate>
deduplicate_candidates(const std::vector<ReleaseCandidate> &candidates,
                       ReleaseFamily family);

std::vector<ReleaseCandidate>
scan_candidates(FileSystem &fsys, const fs::path &root, ReleaseFamily family,
                const std::optional<std::string> &manual_tag = std::nullopt,
                const ScanOptions &options = ScanOptions());

} // namespace protonlink
