// core/links.hpp - Link management entry points
#pragma once

#include "executor.hpp"
#include "family.hpp"
#include "filesystem.hpp"
#include "inventory.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace protonlink {

struct LinkInfo {
  LinkSlot slot;
  std::string name;
  std::optional<fs::path> target; // empty when absent, broken or not a link
};

/**
 * Point the three slots of a family at the three newest installed releases
 * under root. manual_tag names a release that must exist (DiscoveryError
 * otherwise) and takes part in ranking even under a non-default directory
 * name. Per-slot failures are reported in the result, never thrown.
 */
ReconcileResult
manage_links(FileSystem &fsys, const fs::path &root, ReleaseFamily family,
             const std::optional<std::string> &manual_tag = std::nullopt,
             const ScanOptions &options = ScanOptions());

// Same as manage_links without a manual tag; throws NoCandidatesError when
// nothing is installed
ReconcileResult relink(FileSystem &fsys, const fs::path &root,
                       ReleaseFamily family,
                       const ScanOptions &options = ScanOptions());

std::vector<LinkInfo> list_links(FileSystem &fsys, const fs::path &root,
                                 ReleaseFamily family);

/**
 * Delete one installed release directory, drop the slots that pointed at it,
 * then run manage_links so the slots move to the remaining releases.
 * Throws DiscoveryError when the release is not installed and LinkError when
 * its directory cannot be removed.
 */
ReconcileResult remove_release(FileSystem &fsys, const fs::path &root,
                               ReleaseFamily family, const std::string &tag,
                               const ScanOptions &options = ScanOptions());

} // namespace protonlink
