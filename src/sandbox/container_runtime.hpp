#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_types.hpp"

namespace ilbox::sandbox {

// Everything needed to build one hardened `docker run` invocation.
struct LaunchSpec {
    std::string name;
    std::filesystem::path mount_source;
    std::string mount_target;
    std::string workdir;
    bool network = false;
    bool interactive = false;
    ExecutionLimits limits;
    std::vector<std::pair<std::string, std::string>> env;
    std::vector<std::string> command;
};

struct CommandOptions {
    std::chrono::milliseconds timeout{30000};
    std::string input;
    // Per-stream capture cap; 0 keeps everything.
    std::size_t max_output_bytes = 0;
};

// Handle to the container engine CLI. Constructed once at startup and passed
// by reference to every component that launches containers.
class ContainerRuntime {
public:
    ContainerRuntime(const config::RuntimeConfig& config, std::string container_user);

    // Absolute path of the engine binary; throws kInfrastructure if missing.
    std::string ResolveBinary() const;

    // Runs the engine binary with `args`, stdin fed from options.input and
    // stdout/stderr captured. On timeout the whole process group is killed
    // and the partial output is returned with timed_out set.
    ExecutionResult Exec(const std::vector<std::string>& args, const CommandOptions& options) const;

    std::vector<std::string> BuildRunArgs(const LaunchSpec& spec) const;

    bool ImagePresent() const;
    void EnsureImage(bool pull) const;
    HealthStatus Health() const;
    bool WasOomKilled(const std::string& container_name) const;
    void RemoveContainer(const std::string& container_name) const;

    const std::string& Image() const { return image_; }
    const std::string& ContainerUser() const { return container_user_; }

    static std::string NewContainerName(const std::string& prefix);

    // wait(2) status to a shell-style exit code (128 + signal when killed).
    static int DecodeExitStatus(int status);

private:
    std::string binary_;
    std::string image_;
    std::string container_user_;
    std::chrono::seconds pull_timeout_;
    mutable std::mutex resolve_mutex_;
    mutable std::string resolved_binary_;
};

}  // namespace ilbox::sandbox
