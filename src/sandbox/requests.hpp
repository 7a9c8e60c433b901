#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ilbox::sandbox {

struct RunRequest {
    std::string user_id;
    std::string code;
    std::string workdir;
};

struct InstallRequest {
    std::string user_id;
    std::vector<std::string> packages;
};

struct ListRequest {
    std::string user_id;
    std::string path;
    std::size_t page = 0;
};

struct WriteRequest {
    std::string user_id;
    std::string path;
    std::string content;
};

struct RemoveRequest {
    std::string user_id;
    std::string path;
    bool recursive = false;
};

inline constexpr std::size_t kMaxPackages = 32;
inline constexpr std::size_t kMaxPackageLength = 128;
inline constexpr std::size_t kMaxCodeBytes = 256 * 1024;
inline constexpr std::size_t kMaxWriteBytes = 1024 * 1024;

bool IsValidUserId(const std::string& user_id);
bool IsValidPackageSpec(const std::string& spec);

// Strips ``` fences (with an optional python/py language hint) or a single
// pair of inline backticks around a code snippet.
std::string ExtractCodeBlock(const std::string& raw);

// Each Make* throws SandboxError(kInvalidRequest) on malformed input.
RunRequest MakeRunRequest(const std::string& user_id, const std::string& raw_code, const std::string& workdir = {});
InstallRequest MakeInstallRequest(const std::string& user_id, const std::string& raw_packages);
InstallRequest MakeInstallRequest(const std::string& user_id, const std::vector<std::string>& packages);
ListRequest MakeListRequest(const std::string& user_id, const std::string& path, long long page);
WriteRequest MakeWriteRequest(const std::string& user_id, const std::string& path, const std::string& content);
RemoveRequest MakeRemoveRequest(const std::string& user_id, const std::string& path, bool recursive);

void RequireValidUserId(const std::string& user_id);

}  // namespace ilbox::sandbox
