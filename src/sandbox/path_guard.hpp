#pragma once

#include <filesystem>
#include <string>

namespace ilbox::sandbox {

// Resolves caller-supplied relative paths against a sandbox root. Every
// resolution is canonicalized after following symlinks; anything landing
// outside the canonical root throws SandboxError(kPathEscape).
class PathGuard {
public:
    static std::filesystem::path Resolve(const std::filesystem::path& root,
                                         const std::string& user_path);

    // Like Resolve, but the final component is kept literal so that a symlink
    // can be addressed (and removed) without following it. The root itself
    // cannot be addressed this way.
    static std::filesystem::path ResolveEntry(const std::filesystem::path& root,
                                              const std::string& user_path);

    // Path of `absolute` relative to `root`, "." for the root itself.
    static std::string Relative(const std::filesystem::path& root,
                                const std::filesystem::path& absolute);

    static bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate);

private:
    static std::string Normalize(const std::string& user_path);
    static std::filesystem::path CanonicalRoot(const std::filesystem::path& root);
};

}  // namespace ilbox::sandbox
