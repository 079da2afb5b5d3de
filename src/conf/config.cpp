// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <fstream>
#include <stdexcept>

namespace protonlink {

Config::Config() : extract_dir(expand_home(DEFAULT_EXTRACT_DIR)) {}

Config Config::load_default() {
  Config config;
  // Try to load from default location if exists
  fs::path default_path = default_config_path();
  if (fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load " + default_path.string() + " (" + e.what() +
               "), using defaults");
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos)
      continue;

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1), " \t\"");

    if (key == "extract_dir")
      config.extract_dir = expand_home(value);
    else if (key == "fork") {
      auto fork = family_from_string(value);
      if (!fork) {
        throw std::runtime_error("Unknown fork in " + path.string() + ": " +
                                 value);
      }
      config.fork = *fork;
    } else if (key == "strict_names")
      config.strict_names = (value == "true");
    else if (key == "verbose")
      config.verbose = (value == "true");
    else if (key == "log_file")
      config.log_file = value.empty() ? fs::path() : expand_home(value);
    else
      LOG_DEBUG("Ignoring unknown config key: " + key);
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  if (path.has_parent_path() && !ensure_dir_exists(path.parent_path())) {
    return false;
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# protonlink configuration\n";
  file << "extract_dir = \"" << extract_dir.string() << "\"\n";
  file << "fork = \"" << family_to_string(fork) << "\"\n";
  file << "strict_names = " << (strict_names ? "true" : "false") << "\n";
  file << "verbose = " << (verbose ? "true" : "false") << "\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }

  return file.good();
}

ScanOptions Config::scan_options() const {
  ScanOptions options;
  options.strict_names = strict_names;
  return options;
}

void Config::merge_with_cli(const fs::path &extract_dir_override,
                            const std::optional<ReleaseFamily> &fork_override,
                            const std::optional<bool> &strict_override,
                            bool verbose_override,
                            const fs::path &log_file_override) {
  if (!extract_dir_override.empty()) {
    extract_dir = expand_home(extract_dir_override.string());
  }
  if (fork_override) {
    fork = *fork_override;
  }
  if (strict_override) {
    strict_names = *strict_override;
  }
  if (verbose_override) {
    verbose = true;
  }
  if (!log_file_override.empty()) {
    log_file = expand_home(log_file_override.string());
  }
}

} // namespace protonlink
