// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include "defs.hpp"
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace protonlink {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;
  log_file_.reset();

  if (!log_path.empty()) {
    if (log_path.has_parent_path() && !ensure_dir_exists(log_path.parent_path())) {
      return;
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  auto now = std::time(nullptr);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S",
                std::localtime(&now));

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return true;
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

fs::path expand_home(const std::string &path) {
  if (path.empty() || path[0] != '~') {
    return fs::path(path);
  }
  if (path.size() > 1 && path[1] != '/') {
    // ~user is not supported
    return fs::path(path);
  }

  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return fs::path(path);
  }

  std::string rest = path.substr(1);
  while (!rest.empty() && rest[0] == '/') {
    rest.erase(0, 1);
  }
  return rest.empty() ? fs::path(home) : fs::path(home) / rest;
}

fs::path default_config_path() {
  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  fs::path base = (xdg != nullptr && *xdg != '\0') ? fs::path(xdg)
                                                    : expand_home("~/.config");
  return base / CONFIG_SUBDIR / CONFIG_FILENAME;
}

std::string trim(const std::string &s, const char *chars) {
  auto start = s.find_first_not_of(chars);
  if (start == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(chars);
  return s.substr(start, end - start + 1);
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace protonlink
