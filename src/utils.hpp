// utils.hpp - Utility functions
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace fs = std::filesystem;

namespace protonlink {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);
  bool verbose() const { return verbose_; }

private:
  Logger() = default;
  bool verbose_ = false;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);
fs::path expand_home(const std::string &path);
fs::path default_config_path();

// String utilities
std::string trim(const std::string &s, const char *chars = " \t");
bool starts_with(const std::string &s, const std::string &prefix);

} // namespace protonlink
