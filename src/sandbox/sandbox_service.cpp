#include "sandbox/sandbox_service.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "sandbox/log_throttler.hpp"
#include "sandbox/path_guard.hpp"
#include "sandbox/root_dir.hpp"
#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace ilbox::sandbox {
namespace {

constexpr const char* kMissingMessage = "No sandbox found or it expired";

SandboxError Missing() {
    return SandboxError(ErrorCode::kNotFound, kMissingMessage);
}

bool EntryLess(const DirectoryEntry& lhs, const DirectoryEntry& rhs) {
    if (lhs.is_directory != rhs.is_directory) {
        return lhs.is_directory;
    }
    const auto left = utils::ToLower(lhs.name);
    const auto right = utils::ToLower(rhs.name);
    if (left != right) {
        return left < right;
    }
    return lhs.name < rhs.name;
}

}  // namespace

ServiceOptions ServiceOptions::FromConfig(const config::Config& config) {
    ServiceOptions options{};
    options.retention = std::chrono::seconds(config.sandbox.retention_s);
    options.run_timeout = std::chrono::seconds(config.limits.timeout_s);
    options.limits.cpus = config.limits.cpus;
    options.limits.memory = config.limits.memory;
    options.limits.pids_limit = config.limits.pids_limit;
    options.limits.tmpfs_size = config.limits.tmpfs_size;

    options.launcher.max_output_bytes = config.limits.max_output_bytes;
    options.launcher.ensure_image = !config.runtime.pull_on_startup;
    options.launcher.echo_last_expr = config.limits.echo_last_expr;

    options.install.timeout = std::chrono::seconds(config.install.timeout_s);
    options.install.limits = options.limits;
    options.install.ensure_image = !config.runtime.pull_on_startup;
    options.install.max_log_bytes = config.install.max_log_bytes;
    options.log_interval = std::chrono::milliseconds(config.install.log_interval_ms);

    options.inline_limit = config.output.inline_limit;
    options.preview_chars = config.output.preview_chars;
    options.log_tail_chars = config.output.log_tail_chars;
    return options;
}

SandboxService::SandboxService(SandboxRegistry& registry,
                               LockTable& locks,
                               const ContainerRuntime& runtime,
                               ServiceOptions options)
    : registry_(registry)
    , locks_(locks)
    , runtime_(runtime)
    , options_(std::move(options))
    , launcher_(runtime_, options_.launcher)
    , installer_(runtime_, LogThrottler(options_.log_interval), options_.install)
    , formatter_(options_.inline_limit, options_.preview_chars, options_.log_tail_chars) {}

bool SandboxService::Expired(const Sandbox& sandbox) const {
    return SandboxRegistry::IsExpired(sandbox, utils::Now(), options_.retention);
}

Sandbox SandboxService::Require(const std::string& user_id) const {
    auto sandbox = registry_.Find(user_id);
    if (!sandbox.has_value()) {
        throw Missing();
    }
    return *sandbox;
}

// Lock entries are only kept for users that have a sandbox.
void SandboxService::ForgetIfMissing(const std::string& user_id) {
    try {
        auto guard = locks_.AcquireExecution(user_id);
        auto files = guard.LockFiles();
        if (!registry_.Find(user_id).has_value()) {
            locks_.Erase(user_id);
        }
    } catch (const SandboxError& ex) {
        // The current holder drops the entry itself when the sandbox is gone.
        if (ex.Code() != ErrorCode::kSandboxBusy) {
            throw;
        }
    }
}

Sandbox SandboxService::RequireWithFiles(LockTable::SharedGuard& files, const std::string& user_id) {
    auto sandbox = registry_.Find(user_id);
    if (!sandbox.has_value()) {
        files.Unlock();
        ForgetIfMissing(user_id);
        throw Missing();
    }
    return *sandbox;
}

Sandbox SandboxService::LoadLocked(LockTable::ExclusiveGuard& guard, const std::string& user_id) {
    auto sandbox = registry_.Find(user_id);
    if (!sandbox.has_value()) {
        auto files = guard.LockFiles();
        locks_.Erase(user_id);
        throw Missing();
    }
    if (!Expired(*sandbox)) {
        return *sandbox;
    }
    auto files = guard.LockFiles();
    registry_.Delete(user_id);
    locks_.Erase(user_id);
    utils::LogInfo("service", "removed expired sandbox on access user=" + user_id);
    throw Missing();
}

Sandbox SandboxService::LoadForFiles(const std::string& user_id) {
    auto sandbox = Require(user_id);
    if (Expired(sandbox)) {
        auto guard = locks_.AcquireExecution(user_id);
        sandbox = LoadLocked(guard, user_id);
    }
    return sandbox;
}

Sandbox SandboxService::Create(const std::string& user_id) {
    RequireValidUserId(user_id);
    if (auto existing = registry_.Find(user_id); existing.has_value() && Expired(*existing)) {
        auto guard = locks_.AcquireExecution(user_id);
        auto files = guard.LockFiles();
        registry_.Delete(user_id);
        locks_.Erase(user_id);
        utils::LogInfo("service", "replacing expired sandbox user=" + user_id);
    }
    return registry_.Create(user_id);
}

RunOutcome SandboxService::Run(const RunRequest& request) {
    auto guard = locks_.AcquireExecution(request.user_id);
    const auto sandbox = LoadLocked(guard, request.user_id);

    ExecutionRequest execution{};
    execution.code = request.code;
    execution.workdir = request.workdir;
    execution.limits = options_.limits;
    execution.timeout = options_.run_timeout;

    RunOutcome outcome{};
    outcome.result = launcher_.Run(sandbox, execution);
    registry_.Touch(request.user_id);
    outcome.formatted = formatter_.Format(formatter_.Render(outcome.result));
    return outcome;
}

DirectoryPage SandboxService::ListDirectory(const ListRequest& request) {
    LoadForFiles(request.user_id);
    auto files = locks_.AcquireFiles(request.user_id);
    const auto sandbox = RequireWithFiles(files, request.user_id);

    const auto dir = PathGuard::Resolve(sandbox.root, request.path);
    const auto rel = PathGuard::Relative(sandbox.root, dir);
    auto entries = RootDir(sandbox.root).List(rel);
    std::sort(entries.begin(), entries.end(), EntryLess);

    DirectoryPage page{};
    page.cwd = rel;
    page.total_entries = entries.size();
    const auto page_size = std::max<std::size_t>(options_.page_size, 1);
    page.total_pages = std::max<std::size_t>(1, (entries.size() + page_size - 1) / page_size);
    page.page = std::min(request.page, page.total_pages - 1);
    const auto begin = std::min(entries.size(), page.page * page_size);
    const auto end = std::min(entries.size(), begin + page_size);
    page.entries.assign(std::make_move_iterator(entries.begin() + static_cast<std::ptrdiff_t>(begin)),
                        std::make_move_iterator(entries.begin() + static_cast<std::ptrdiff_t>(end)));

    registry_.Touch(request.user_id);
    return page;
}

std::uintmax_t SandboxService::WriteFile(const WriteRequest& request) {
    LoadForFiles(request.user_id);
    auto files = locks_.AcquireFiles(request.user_id);
    const auto sandbox = RequireWithFiles(files, request.user_id);

    // The sandbox's own code may be running and rearranging the tree, so the
    // resolved path is walked again without following links.
    const auto target = PathGuard::Resolve(sandbox.root, request.path);
    const auto rel = PathGuard::Relative(sandbox.root, target);
    const auto written = RootDir(sandbox.root).WriteFile(rel, request.content);

    registry_.Touch(request.user_id);
    utils::LogDebug("service", "wrote user=" + request.user_id + " path=" + rel +
                    " bytes=" + std::to_string(written));
    return written;
}

void SandboxService::RemoveEntry(const RemoveRequest& request) {
    LoadForFiles(request.user_id);
    auto files = locks_.AcquireFiles(request.user_id);
    const auto sandbox = RequireWithFiles(files, request.user_id);

    const auto target = PathGuard::ResolveEntry(sandbox.root, request.path);
    RootDir(sandbox.root).Remove(PathGuard::Relative(sandbox.root, target), request.recursive);
    registry_.Touch(request.user_id);
}

InstallResult SandboxService::InstallPackages(const InstallRequest& request, const LogSink& sink) {
    auto pending = PrepareInstall(request);
    return FinishInstall(*pending, sink);
}

std::unique_ptr<PendingInstall> SandboxService::PrepareInstall(const InstallRequest& request) {
    auto guard = locks_.AcquireExecution(request.user_id);
    auto sandbox = LoadLocked(guard, request.user_id);
    return std::make_unique<PendingInstall>(PendingInstall{std::move(guard), std::move(sandbox), request.packages});
}

InstallResult SandboxService::FinishInstall(PendingInstall& pending, const LogSink& sink) {
    auto result = installer_.Install(pending.sandbox, pending.packages, sink);
    registry_.Touch(pending.sandbox.user_id);
    return result;
}

void SandboxService::DeleteSandbox(const std::string& user_id) {
    RequireValidUserId(user_id);
    auto guard = locks_.AcquireExecution(user_id);
    auto files = guard.LockFiles();
    if (!registry_.Find(user_id).has_value()) {
        locks_.Erase(user_id);
        throw Missing();
    }
    registry_.Delete(user_id);
    locks_.Erase(user_id);
}

Sandbox SandboxService::Info(const std::string& user_id) {
    RequireValidUserId(user_id);
    LoadForFiles(user_id);
    auto files = locks_.AcquireFiles(user_id);
    auto sandbox = Require(user_id);
    sandbox.size_bytes = SandboxRegistry::MeasureSize(sandbox);
    return sandbox;
}

HealthStatus SandboxService::HealthCheck() const {
    return runtime_.Health();
}

void SandboxService::PrepareImage() const {
    utils::LogInfo("service", "ensuring image " + runtime_.Image() + " is present");
    runtime_.EnsureImage(true);
}

}  // namespace ilbox::sandbox
