#ifndef PROTONLINK_TEST_HELPERS_HPP
#define PROTONLINK_TEST_HELPERS_HPP

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "core/filesystem.hpp"

namespace fs = std::filesystem;

namespace protonlink::test {

/**
 * LocalFileSystem that counts mutations and can be told to refuse symlink
 * creation for given link names with EACCES.
 */
class RecordingFileSystem : public LocalFileSystem {
public:
    void create_directory_symlink(const fs::path& target,
                                  const fs::path& link) override {
        if (denied.count(link.filename().string()) != 0) {
            throw fs::filesystem_error(
                "create_directory_symlink", target, link,
                std::make_error_code(std::errc::permission_denied));
        }
        ++mutations;
        LocalFileSystem::create_directory_symlink(target, link);
    }

    void remove_symlink(const fs::path& link) override {
        ++mutations;
        LocalFileSystem::remove_symlink(link);
    }

    void remove_all(const fs::path& path) override {
        ++mutations;
        LocalFileSystem::remove_all(path);
    }

    int mutations = 0;
    std::set<std::string> denied;
};

class ScratchDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string tmpl =
            (fs::temp_directory_path() / "protonlink_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* dir = mkdtemp(buf.data());
        ASSERT_NE(dir, nullptr);
        root = fs::canonical(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path makeRelease(const std::string& name) {
        fs::path dir = root / name;
        fs::create_directories(dir / "files");
        std::ofstream(dir / "version") << name << "\n";
        return dir;
    }

    void makeLink(const std::string& name, const fs::path& target) {
        fs::create_directory_symlink(target, root / name);
    }

    fs::path resolved(const std::string& name) {
        return fs::canonical(root / name);
    }

    bool isLink(const std::string& name) {
        return fs::is_symlink(fs::symlink_status(root / name));
    }

    fs::path root;
    RecordingFileSystem fsys;
};

}  // namespace protonlink::test

#endif  // PROTONLINK_TEST_HELPERS_HPP
