// conf/config.hpp - Configuration management
#pragma once

#include "../core/family.hpp"
#include "../core/inventory.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace protonlink {

struct Config {
  fs::path extract_dir;
  ReleaseFamily fork = ReleaseFamily::GEProton;
  // Both families share one compat dir, so only well-formed tags are ranked
  bool strict_names = true;
  bool verbose = false;
  fs::path log_file;

  Config();

  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;
  ScanOptions scan_options() const;

  void merge_with_cli(const fs::path &extract_dir_override,
                      const std::optional<ReleaseFamily> &fork_override,
                      const std::optional<bool> &strict_override,
                      bool verbose_override,
                      const fs::path &log_file_override);
};

} // namespace protonlink
