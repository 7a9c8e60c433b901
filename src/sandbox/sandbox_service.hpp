#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/container_launcher.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/install_job_runner.hpp"
#include "sandbox/lock_table.hpp"
#include "sandbox/output_formatter.hpp"
#include "sandbox/requests.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "sandbox/sandbox_types.hpp"

namespace ilbox::sandbox {

struct ServiceOptions {
    std::chrono::seconds retention{7 * 24 * 3600};
    std::chrono::seconds run_timeout{30};
    ExecutionLimits limits;
    std::size_t page_size = 20;
    LauncherOptions launcher;
    InstallOptions install;
    std::chrono::milliseconds log_interval{3000};
    std::size_t inline_limit = 1900;
    std::size_t preview_chars = 1800;
    std::size_t log_tail_chars = 1800;

    static ServiceOptions FromConfig(const config::Config& config);
};

struct RunOutcome {
    ExecutionResult result;
    FormattedOutput formatted;
};

// An install that has passed its checks and holds the user's execution lock
// until it is destroyed.
struct PendingInstall {
    LockTable::ExclusiveGuard guard;
    Sandbox sandbox;
    std::vector<std::string> packages;
};

// Entry point for front-ends. Every operation validates its request, takes the
// user's lock, applies lazy expiry and refreshes last-activity on success.
class SandboxService {
public:
    SandboxService(SandboxRegistry& registry,
                   LockTable& locks,
                   const ContainerRuntime& runtime,
                   ServiceOptions options);

    Sandbox Create(const std::string& user_id);
    RunOutcome Run(const RunRequest& request);
    DirectoryPage ListDirectory(const ListRequest& request);
    std::uintmax_t WriteFile(const WriteRequest& request);
    void RemoveEntry(const RemoveRequest& request);
    InstallResult InstallPackages(const InstallRequest& request, const LogSink& sink);

    // Split form of InstallPackages for streaming front-ends: lock and lookup
    // errors surface from PrepareInstall before any log line is produced.
    std::unique_ptr<PendingInstall> PrepareInstall(const InstallRequest& request);
    InstallResult FinishInstall(PendingInstall& pending, const LogSink& sink);
    void DeleteSandbox(const std::string& user_id);

    // Record plus measured size. Does not count as activity.
    Sandbox Info(const std::string& user_id);

    HealthStatus HealthCheck() const;
    void PrepareImage() const;

    const OutputFormatter& Formatter() const { return formatter_; }
    const ServiceOptions& Options() const { return options_; }

private:
    Sandbox LoadLocked(LockTable::ExclusiveGuard& guard, const std::string& user_id);
    Sandbox LoadForFiles(const std::string& user_id);
    Sandbox Require(const std::string& user_id) const;
    Sandbox RequireWithFiles(LockTable::SharedGuard& files, const std::string& user_id);
    void ForgetIfMissing(const std::string& user_id);
    bool Expired(const Sandbox& sandbox) const;

    SandboxRegistry& registry_;
    LockTable& locks_;
    const ContainerRuntime& runtime_;
    ServiceOptions options_;
    ContainerLauncher launcher_;
    InstallJobRunner installer_;
    OutputFormatter formatter_;
};

}  // namespace ilbox::sandbox
