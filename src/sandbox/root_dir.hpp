#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "sandbox/sandbox_types.hpp"

namespace ilbox::sandbox {

// Directory handle on a sandbox root. Paths handed to it are relative to the
// root and are walked one component at a time with O_NOFOLLOW, so a link
// swapped in after PathGuard checked the path is refused instead of followed.
// A link met anywhere on the walk throws SandboxError(kPathEscape).
class RootDir {
public:
    explicit RootDir(const std::filesystem::path& root);
    ~RootDir();
    RootDir(const RootDir&) = delete;
    RootDir& operator=(const RootDir&) = delete;

    // Creates missing parent directories and truncates an existing file.
    std::uintmax_t WriteFile(const std::string& rel_path, const std::string& content) const;

    // Links are unlinked, never followed, including inside a recursive removal.
    void Remove(const std::string& rel_path, bool recursive) const;

    // Unsorted entries of a directory ("." for the root itself).
    std::vector<DirectoryEntry> List(const std::string& rel_path) const;

private:
    int OpenDirectory(const std::vector<std::string>& components, std::size_t count, bool create) const;

    std::filesystem::path root_;
    int fd_ = -1;
};

}  // namespace ilbox::sandbox
