#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ilbox::sandbox {

// Directory name reserved under every sandbox root for installed packages.
inline constexpr const char* kPackagesDir = ".site-packages";
inline constexpr const char* kContainerWorkspace = "/workspace";
inline constexpr const char* kContainerPackages = "/packages";

struct Sandbox {
    std::string user_id;
    std::filesystem::path root;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_used_at;
    std::optional<std::uintmax_t> size_bytes;
};

struct ExecutionLimits {
    std::string cpus = "1.0";
    std::string memory = "256m";
    int pids_limit = 64;
    std::string tmpfs_size = "64m";
};

struct ExecutionRequest {
    std::string code;
    // Relative to the sandbox root; empty means the root.
    std::string workdir;
    ExecutionLimits limits;
    std::chrono::seconds timeout{30};
};

struct ExecutionResult {
    int exit_code = -1;
    bool timed_out = false;
    bool resource_exceeded = false;
    bool truncated = false;
    std::string output;
    std::string error;
    std::chrono::milliseconds elapsed{0};
};

struct InstallJob {
    std::string user_id;
    std::vector<std::string> packages;
    std::string log;
    std::chrono::steady_clock::time_point started_at;
    std::optional<std::chrono::steady_clock::time_point> last_emit_at;
    bool terminal = false;
    bool success = false;
};

struct LogUpdate {
    std::string snapshot;
    bool final = false;
    bool success = false;
};

struct InstallResult {
    bool success = false;
    int exit_code = -1;
    bool timed_out = false;
    std::string log;
};

struct DirectoryEntry {
    std::string name;
    bool is_directory = false;
    std::uintmax_t size_bytes = 0;
};

struct DirectoryPage {
    std::string cwd;
    std::vector<DirectoryEntry> entries;
    std::size_t page = 0;
    std::size_t total_pages = 1;
    std::size_t total_entries = 0;
};

struct HealthStatus {
    bool runtime_reachable = false;
    bool image_present = false;
    std::string message;
};

}  // namespace ilbox::sandbox
