#pragma once

#include <cstddef>

#include "sandbox/container_runtime.hpp"
#include "sandbox/sandbox_types.hpp"

namespace ilbox::sandbox {

struct LauncherOptions {
    std::size_t max_output_bytes = 100000;
    // Check (and pull) the image before each run; used when the image was not
    // pre-pulled at startup.
    bool ensure_image = false;
    // Print the repr of a trailing bare expression, as an interactive shell would.
    bool echo_last_expr = true;
};

// Runs user code in a locked-down, network-less container with the sandbox
// root mounted at /workspace. The caller holds the sandbox's execution lock.
class ContainerLauncher {
public:
    ContainerLauncher(const ContainerRuntime& runtime, LauncherOptions options);

    ExecutionResult Run(const Sandbox& sandbox, const ExecutionRequest& request) const;

    LaunchSpec BuildLaunchSpec(const Sandbox& sandbox,
                               const ExecutionRequest& request,
                               const std::string& container_name) const;

private:
    const ContainerRuntime& runtime_;
    LauncherOptions options_;
};

}  // namespace ilbox::sandbox
