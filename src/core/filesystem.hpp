// core/filesystem.hpp - Filesystem provider used by the link pipeline
#pragma once

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace protonlink {

enum class EntryKind { Absent, Directory, Symlink, Other };

struct PathState {
  EntryKind kind = EntryKind::Absent;
  // For symlinks: true when the link resolves to an existing directory
  bool resolves = false;
  // For symlinks that resolve: canonical target
  fs::path target;

  bool exists() const { return kind != EntryKind::Absent; }
  bool is_symlink() const { return kind == EntryKind::Symlink; }
  bool is_real_directory() const { return kind == EntryKind::Directory; }
};

/**
 * Synchronous filesystem operations the pipeline depends on.
 *
 * Probes never throw for missing paths; they report EntryKind::Absent.
 * Mutations throw fs::filesystem_error, whose code() tells a permission
 * failure (std::errc::permission_denied) apart from a missing path
 * (std::errc::no_such_file_or_directory).
 */
class FileSystem {
public:
  virtual ~FileSystem() = default;

  // Immediate children of dir; throws if dir cannot be listed
  virtual std::vector<fs::path> list_directory(const fs::path &dir) = 0;
  virtual PathState probe(const fs::path &path) = 0;
  virtual void create_directory_symlink(const fs::path &target,
                                        const fs::path &link) = 0;
  virtual void remove_symlink(const fs::path &link) = 0;
  virtual void remove_all(const fs::path &path) = 0;
  // Canonical form of path, empty when it does not resolve
  virtual fs::path canonical(const fs::path &path) = 0;
};

class LocalFileSystem : public FileSystem {
public:
  std::vector<fs::path> list_directory(const fs::path &dir) override;
  PathState probe(const fs::path &path) override;
  void create_directory_symlink(const fs::path &target,
                                const fs::path &link) override;
  void remove_symlink(const fs::path &link) override;
  void remove_all(const fs::path &path) override;
  fs::path canonical(const fs::path &path) override;
};

FileSystem &local_filesystem();

} // namespace protonlink
