#include "sandbox/path_guard.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"

namespace ilbox::sandbox {
namespace fs = std::filesystem;

std::string PathGuard::Normalize(const std::string& user_path) {
    auto rel = utils::Trim(user_path);
    std::replace(rel.begin(), rel.end(), '\\', '/');
    const auto first = rel.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    rel.erase(0, first);
    rel.erase(rel.find_last_not_of('/') + 1);
    if (rel.find('\0') != std::string::npos) {
        throw SandboxError(ErrorCode::kInvalidRequest, "path contains a NUL byte");
    }
    return rel;
}

fs::path PathGuard::CanonicalRoot(const fs::path& root) {
    std::error_code ec;
    auto canonical = fs::canonical(root, ec);
    if (ec) {
        throw SandboxError(ErrorCode::kNotFound, "sandbox root is missing: " + root.string());
    }
    return canonical;
}

bool PathGuard::IsWithin(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++cand_it) {
        // A trailing separator shows up as an empty final element.
        if (root_it->empty() && std::next(root_it) == root.end()) {
            break;
        }
        if (cand_it == candidate.end() || *root_it != *cand_it) {
            return false;
        }
    }
    return true;
}

fs::path PathGuard::Resolve(const fs::path& root, const std::string& user_path) {
    const auto canonical_root = CanonicalRoot(root);
    const auto rel = Normalize(user_path);
    if (rel.empty()) {
        return canonical_root;
    }

    const auto joined = (canonical_root / rel).lexically_normal();
    std::error_code ec;
    auto resolved = fs::weakly_canonical(joined, ec);
    if (ec) {
        throw SandboxError(ErrorCode::kPathEscape, "unable to resolve path: " + user_path);
    }
    if (!resolved.has_filename()) {
        resolved = resolved.parent_path();
    }
    if (!IsWithin(canonical_root, resolved)) {
        throw SandboxError(ErrorCode::kPathEscape, "path escapes the sandbox: " + user_path);
    }
    // weakly_canonical stops at the first missing component, so a dangling
    // link in the tail is still literal and would be followed on create.
    for (auto prefix = resolved; prefix != canonical_root && prefix.has_relative_path(); prefix = prefix.parent_path()) {
        if (fs::is_symlink(fs::symlink_status(prefix, ec))) {
            throw SandboxError(ErrorCode::kPathEscape, "path goes through a dangling link: " + user_path);
        }
    }
    return resolved;
}

fs::path PathGuard::ResolveEntry(const fs::path& root, const std::string& user_path) {
    const auto rel = Normalize(user_path);
    const fs::path rel_path(rel);
    const auto leaf = rel_path.filename();
    if (rel.empty() || leaf.empty() || leaf == "." || leaf == "..") {
        // "dir/.." style inputs still go through the full check so escapes
        // report as escapes rather than as invalid names.
        const auto resolved = Resolve(root, user_path);
        if (resolved == CanonicalRoot(root)) {
            throw SandboxError(ErrorCode::kInvalidRequest, "the sandbox root cannot be addressed");
        }
        throw SandboxError(ErrorCode::kInvalidRequest, "path must name an entry: " + user_path);
    }

    const auto parent = Resolve(root, rel_path.parent_path().generic_string());
    return parent / leaf;
}

std::string PathGuard::Relative(const fs::path& root, const fs::path& absolute) {
    std::error_code ec;
    auto canonical_root = fs::weakly_canonical(root, ec);
    if (ec) {
        canonical_root = root;
    }
    const auto rel = absolute.lexically_relative(canonical_root);
    if (rel.empty() || rel == ".") {
        return ".";
    }
    return rel.generic_string();
}

}  // namespace ilbox::sandbox
