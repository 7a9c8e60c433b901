#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "sandbox/container_runtime.hpp"
#include "sandbox/log_throttler.hpp"
#include "sandbox/sandbox_types.hpp"

namespace ilbox::sandbox {

using LogSink = std::function<void(const LogUpdate&)>;

struct InstallOptions {
    std::chrono::seconds timeout{600};
    ExecutionLimits limits;
    std::size_t channel_capacity = 256;
    std::chrono::milliseconds poll_interval{200};
    std::size_t max_log_bytes = 1024 * 1024;
    bool ensure_image = false;
};

// Installs packages into <root>/.site-packages with pip inside a container
// that has network access but sees only that directory. Log lines are read
// on a separate thread and forwarded to the sink through the throttler.
class InstallJobRunner {
public:
    InstallJobRunner(const ContainerRuntime& runtime, LogThrottler throttler, InstallOptions options);

    InstallResult Install(const Sandbox& sandbox,
                          const std::vector<std::string>& packages,
                          const LogSink& sink) const;

    LaunchSpec BuildLaunchSpec(const Sandbox& sandbox,
                               const std::vector<std::string>& packages,
                               const std::string& container_name) const;

private:
    void RunJob(InstallJob& job, InstallResult& result, const std::vector<std::string>& args,
                const LogSink& sink) const;
    void Emit(InstallJob& job, const LogSink& sink, std::chrono::steady_clock::time_point now) const;
    void AppendLog(InstallJob& job, const std::string& chunk) const;

    const ContainerRuntime& runtime_;
    LogThrottler throttler_;
    InstallOptions options_;
};

}  // namespace ilbox::sandbox
