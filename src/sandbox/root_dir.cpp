#include "sandbox/root_dir.hpp"

#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

#include "sandbox/sandbox_error.hpp"

namespace ilbox::sandbox {
namespace {

constexpr int kDirectoryFlags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;

class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    int Release() {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

std::string Describe(int err) {
    return std::error_code(err, std::generic_category()).message();
}

std::vector<std::string> Split(const std::string& rel_path) {
    std::vector<std::string> components;
    std::size_t start = 0;
    while (start <= rel_path.size()) {
        auto end = rel_path.find('/', start);
        if (end == std::string::npos) {
            end = rel_path.size();
        }
        auto component = rel_path.substr(start, end - start);
        if (component == "..") {
            throw SandboxError(ErrorCode::kPathEscape, "path escapes the sandbox: " + rel_path);
        }
        if (!component.empty() && component != ".") {
            components.push_back(std::move(component));
        }
        start = end + 1;
    }
    return components;
}

SandboxError WalkError(int err, int dirfd, const std::string& name, const std::string& rel_path) {
    if (err == ELOOP) {
        return SandboxError(ErrorCode::kPathEscape, "path goes through a link: " + rel_path);
    }
    if (err == ENOTDIR) {
        struct stat st {};
        if (::fstatat(dirfd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) == 0 && S_ISLNK(st.st_mode)) {
            return SandboxError(ErrorCode::kPathEscape, "path goes through a link: " + rel_path);
        }
        return SandboxError(ErrorCode::kInvalidRequest, "not a directory: " + rel_path);
    }
    if (err == ENOENT) {
        return SandboxError(ErrorCode::kPathNotFound, "path not found: " + rel_path);
    }
    return SandboxError(ErrorCode::kStorage, "cannot open " + rel_path + ": " + Describe(err));
}

std::vector<std::string> ReadNames(int dirfd, const std::string& rel_path) {
    const int copy = ::fcntl(dirfd, F_DUPFD_CLOEXEC, 0);
    if (copy < 0) {
        throw SandboxError(ErrorCode::kStorage, "cannot list " + rel_path + ": " + Describe(errno));
    }
    DIR* dir = ::fdopendir(copy);
    if (dir == nullptr) {
        const int err = errno;
        ::close(copy);
        throw SandboxError(ErrorCode::kStorage, "cannot list " + rel_path + ": " + Describe(err));
    }
    ::rewinddir(dir);

    std::vector<std::string> names;
    while (const dirent* entry = ::readdir(dir)) {
        const std::string name = entry->d_name;
        if (name != "." && name != "..") {
            names.push_back(name);
        }
    }
    ::closedir(dir);
    return names;
}

void RemoveContents(int dirfd, const std::string& rel_path) {
    for (const auto& name : ReadNames(dirfd, rel_path)) {
        const auto child_path = rel_path + "/" + name;
        struct stat st {};
        if (::fstatat(dirfd, name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
            if (errno == ENOENT) {
                continue;
            }
            throw SandboxError(ErrorCode::kStorage, "cannot inspect " + child_path + ": " + Describe(errno));
        }
        if (S_ISDIR(st.st_mode)) {
            // A directory replaced by a link since fstatat fails to open here
            // and is unlinked below as a plain entry.
            ScopedFd child(::openat(dirfd, name.c_str(), kDirectoryFlags));
            if (child.Valid()) {
                RemoveContents(child.Get(), child_path);
                if (::unlinkat(dirfd, name.c_str(), AT_REMOVEDIR) == 0 || errno == ENOENT) {
                    continue;
                }
                throw SandboxError(ErrorCode::kStorage, "failed to remove " + child_path + ": " + Describe(errno));
            }
        }
        if (::unlinkat(dirfd, name.c_str(), 0) != 0 && errno != ENOENT) {
            throw SandboxError(ErrorCode::kStorage, "failed to remove " + child_path + ": " + Describe(errno));
        }
    }
}

}  // namespace

RootDir::RootDir(const std::filesystem::path& root)
    : root_(root)
    , fd_(::open(root.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)) {
    if (fd_ < 0) {
        if (errno == ENOENT) {
            throw SandboxError(ErrorCode::kNotFound, "sandbox root is missing: " + root.string());
        }
        throw SandboxError(ErrorCode::kStorage, "cannot open sandbox root " + root.string() + ": " + Describe(errno));
    }
}

RootDir::~RootDir() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

int RootDir::OpenDirectory(const std::vector<std::string>& components, std::size_t count, bool create) const {
    ScopedFd current(::fcntl(fd_, F_DUPFD_CLOEXEC, 0));
    if (!current.Valid()) {
        throw SandboxError(ErrorCode::kStorage, "cannot open sandbox root " + root_.string() + ": " + Describe(errno));
    }
    std::string walked;
    for (std::size_t i = 0; i < count; ++i) {
        const auto& name = components[i];
        walked += walked.empty() ? name : "/" + name;

        int next = ::openat(current.Get(), name.c_str(), kDirectoryFlags);
        if (next < 0 && errno == ENOENT && create) {
            if (::mkdirat(current.Get(), name.c_str(), 0755) != 0 && errno != EEXIST) {
                throw SandboxError(ErrorCode::kStorage,
                                   "cannot create parent directories: " + walked + ": " + Describe(errno));
            }
            next = ::openat(current.Get(), name.c_str(), kDirectoryFlags);
        }
        if (next < 0) {
            throw WalkError(errno, current.Get(), name, walked);
        }
        current.Reset(next);
    }
    return current.Release();
}

std::uintmax_t RootDir::WriteFile(const std::string& rel_path, const std::string& content) const {
    const auto components = Split(rel_path);
    if (components.empty()) {
        throw SandboxError(ErrorCode::kInvalidRequest, "a directory exists with that name: " + rel_path);
    }
    ScopedFd dir(OpenDirectory(components, components.size() - 1, true));
    const auto& leaf = components.back();

    ScopedFd file(::openat(dir.Get(), leaf.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644));
    if (!file.Valid()) {
        if (errno == EISDIR) {
            throw SandboxError(ErrorCode::kInvalidRequest, "a directory exists with that name: " + rel_path);
        }
        throw WalkError(errno, dir.Get(), leaf, rel_path);
    }

    std::size_t written = 0;
    while (written < content.size()) {
        const auto count = ::write(file.Get(), content.data() + written, content.size() - written);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw SandboxError(ErrorCode::kStorage, "failed writing " + rel_path + ": " + Describe(errno));
        }
        written += static_cast<std::size_t>(count);
    }
    if (::close(file.Release()) != 0) {
        throw SandboxError(ErrorCode::kStorage, "failed writing " + rel_path + ": " + Describe(errno));
    }
    return written;
}

void RootDir::Remove(const std::string& rel_path, bool recursive) const {
    const auto components = Split(rel_path);
    if (components.empty()) {
        throw SandboxError(ErrorCode::kInvalidRequest, "the sandbox root cannot be addressed");
    }
    ScopedFd parent(OpenDirectory(components, components.size() - 1, false));
    const auto& leaf = components.back();

    struct stat st {};
    if (::fstatat(parent.Get(), leaf.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
        throw WalkError(errno, parent.Get(), leaf, rel_path);
    }
    if (!S_ISDIR(st.st_mode)) {
        if (::unlinkat(parent.Get(), leaf.c_str(), 0) != 0) {
            throw SandboxError(ErrorCode::kStorage, "failed to remove " + rel_path + ": " + Describe(errno));
        }
        return;
    }

    {
        ScopedFd dir(::openat(parent.Get(), leaf.c_str(), kDirectoryFlags));
        if (!dir.Valid()) {
            throw WalkError(errno, parent.Get(), leaf, rel_path);
        }
        if (!ReadNames(dir.Get(), rel_path).empty()) {
            if (!recursive) {
                throw SandboxError(ErrorCode::kNotEmpty, "directory is not empty; use recursive removal: " + rel_path);
            }
            RemoveContents(dir.Get(), rel_path);
        }
    }
    if (::unlinkat(parent.Get(), leaf.c_str(), AT_REMOVEDIR) != 0) {
        throw SandboxError(ErrorCode::kStorage, "failed to remove " + rel_path + ": " + Describe(errno));
    }
}

std::vector<DirectoryEntry> RootDir::List(const std::string& rel_path) const {
    const auto components = Split(rel_path);
    ScopedFd dir(OpenDirectory(components, components.size(), false));

    std::vector<DirectoryEntry> entries;
    for (auto& name : ReadNames(dir.Get(), rel_path)) {
        struct stat st {};
        // Links are reported without following them.
        if (::fstatat(dir.Get(), name.c_str(), &st, AT_SYMLINK_NOFOLLOW) != 0) {
            continue;
        }
        DirectoryEntry entry{};
        entry.name = std::move(name);
        entry.is_directory = S_ISDIR(st.st_mode);
        entry.size_bytes = S_ISREG(st.st_mode) ? static_cast<std::uintmax_t>(st.st_size) : 0;
        entries.push_back(std::move(entry));
    }
    return entries;
}

}  // namespace ilbox::sandbox
