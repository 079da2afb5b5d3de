// core/filesystem.cpp - std::filesystem backed provider
#include "filesystem.hpp"
#include "../utils.hpp"
#include <system_error>

namespace protonlink {

std::vector<fs::path> LocalFileSystem::list_directory(const fs::path &dir) {
  std::vector<fs::path> entries;
  for (const auto &entry : fs::directory_iterator(dir)) {
    entries.push_back(entry.path());
  }
  return entries;
}

PathState LocalFileSystem::probe(const fs::path &path) {
  PathState state;
  std::error_code ec;

  auto st = fs::symlink_status(path, ec);
  if (ec || !fs::exists(st)) {
    return state;
  }

  if (fs::is_symlink(st)) {
    state.kind = EntryKind::Symlink;
    auto target = fs::canonical(path, ec);
    if (!ec && fs::is_directory(target, ec) && !ec) {
      state.resolves = true;
      state.target = target;
    }
    return state;
  }

  state.kind = fs::is_directory(st) ? EntryKind::Directory : EntryKind::Other;
  return state;
}

void LocalFileSystem::create_directory_symlink(const fs::path &target,
                                               const fs::path &link) {
  LOG_DEBUG("symlink " + link.string() + " -> " + target.string());
  fs::create_directory_symlink(target, link);
}

void LocalFileSystem::remove_symlink(const fs::path &link) {
  LOG_DEBUG("unlink " + link.string());
  if (!fs::remove(link)) {
    throw fs::filesystem_error(
        "remove_symlink", link,
        std::make_error_code(std::errc::no_such_file_or_directory));
  }
}

void LocalFileSystem::remove_all(const fs::path &path) {
  LOG_DEBUG("rmtree " + path.string());
  fs::remove_all(path);
}

fs::path LocalFileSystem::canonical(const fs::path &path) {
  std::error_code ec;
  auto resolved = fs::canonical(path, ec);
  if (ec) {
    return fs::path();
  }
  return resolved;
}

FileSystem &local_filesystem() {
  static LocalFileSystem instance;
  return instance;
}

} // namespace protonlink
