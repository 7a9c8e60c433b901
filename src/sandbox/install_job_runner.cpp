#include "sandbox/install_job_runner.hpp"

#include <boost/process.hpp>
#include <filesystem>
#include <memory>
#include <system_error>
#include <thread>

#include "sandbox/log_channel.hpp"
#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace ilbox::sandbox {
namespace bp = boost::process;
namespace fs = std::filesystem;
namespace {

constexpr const char* kTrimmedMarker = "[earlier install output dropped]\n";

// Owns the pip container process and the thread reading its combined output.
// Destruction kills whatever is still running and joins the reader, so no
// reader outlives the job on any exit path.
class InstallProcess {
public:
    InstallProcess(const std::string& binary,
                   const std::vector<std::string>& args,
                   std::size_t channel_capacity)
        : channel_(channel_capacity) {
        try {
            child_ = std::make_unique<bp::child>(
                bp::exe = binary,
                bp::args = args,
                bp::std_in < bp::null,
                (bp::std_out & bp::std_err) > pipe_,
                group_);
        } catch (const bp::process_error& ex) {
            throw SandboxError(ErrorCode::kInfrastructure,
                               std::string("failed to launch container engine: ") + ex.what());
        }
        reader_ = std::thread([this]() { ReadLines(); });
    }

    ~InstallProcess() {
        Terminate();
        channel_.Close();
        if (reader_.joinable()) {
            reader_.join();
        }
    }

    InstallProcess(const InstallProcess&) = delete;
    InstallProcess& operator=(const InstallProcess&) = delete;

    LogChannel<std::string>& Channel() { return channel_; }

    void Terminate() {
        std::error_code ec;
        if (child_ && child_->running(ec)) {
            group_.terminate(ec);
            child_->wait(ec);
        }
    }

    int Wait() {
        std::error_code ec;
        child_->wait(ec);
        return ContainerRuntime::DecodeExitStatus(child_->native_exit_code());
    }

private:
    void ReadLines() {
        std::string line;
        while (std::getline(pipe_, line)) {
            if (!channel_.Push(line + "\n")) {
                break;
            }
        }
        channel_.Close();
    }

    bp::ipstream pipe_;
    bp::group group_;
    std::unique_ptr<bp::child> child_;
    LogChannel<std::string> channel_;
    std::thread reader_;
};

// The engine follows host symlinks when mounting, so the packages directory
// must be a real directory before it is handed to the engine.
void PreparePackagesDir(const Sandbox& sandbox) {
    const auto dir = sandbox.root / kPackagesDir;
    std::error_code ec;
    const auto status = fs::symlink_status(dir, ec);
    if (fs::exists(status) && !fs::is_directory(status)) {
        utils::LogWarn("install", "replacing non-directory " + dir.string());
        fs::remove_all(dir, ec);
        if (ec) {
            throw SandboxError(ErrorCode::kStorage, "cannot clear packages path: " + ec.message());
        }
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw SandboxError(ErrorCode::kStorage, "cannot create packages directory: " + ec.message());
    }
}

}  // namespace

InstallJobRunner::InstallJobRunner(const ContainerRuntime& runtime, LogThrottler throttler, InstallOptions options)
    : runtime_(runtime)
    , throttler_(throttler)
    , options_(options) {}

LaunchSpec InstallJobRunner::BuildLaunchSpec(const Sandbox& sandbox,
                                             const std::vector<std::string>& packages,
                                             const std::string& container_name) const {
    LaunchSpec spec{};
    spec.name = container_name;
    spec.mount_source = sandbox.root / kPackagesDir;
    spec.mount_target = kContainerPackages;
    spec.workdir = kContainerPackages;
    spec.network = true;
    spec.interactive = false;
    spec.limits = options_.limits;
    spec.env.emplace_back("HOME", "/tmp");
    spec.command = {
        "python", "-m", "pip", "install",
        "--no-cache-dir",
        "--disable-pip-version-check",
        "-U",
        "-t", kContainerPackages,
    };
    spec.command.insert(spec.command.end(), packages.begin(), packages.end());
    return spec;
}

void InstallJobRunner::AppendLog(InstallJob& job, const std::string& chunk) const {
    job.log += chunk;
    if (options_.max_log_bytes == 0 || job.log.size() <= options_.max_log_bytes) {
        return;
    }
    // Keep the newest output under the cap, starting on a line boundary,
    // behind a marker saying the head is gone.
    const std::string marker = kTrimmedMarker;
    const auto keep = options_.max_log_bytes > marker.size() ? options_.max_log_bytes - marker.size() : 0;
    auto tail = job.log.substr(job.log.size() - keep);
    const auto newline = tail.find('\n');
    if (newline != std::string::npos && newline + 1 < tail.size()) {
        tail.erase(0, newline + 1);
    }
    job.log = marker + tail;
}

void InstallJobRunner::Emit(InstallJob& job, const LogSink& sink, std::chrono::steady_clock::time_point now) const {
    throttler_.Record(job, now);
    if (!sink) {
        return;
    }
    LogUpdate update{};
    update.snapshot = job.log;
    update.final = job.terminal;
    update.success = job.success;
    sink(update);
}

void InstallJobRunner::RunJob(InstallJob& job, InstallResult& result, const std::vector<std::string>& args,
                              const LogSink& sink) const {
    InstallProcess process(runtime_.ResolveBinary(), args, options_.channel_capacity);
    auto& channel = process.Channel();
    const auto deadline = job.started_at + options_.timeout;
    bool dirty = false;

    while (true) {
        auto chunk = channel.PopFor(options_.poll_interval);
        if (chunk.has_value()) {
            AppendLog(job, *chunk);
            dirty = true;
        } else if (channel.Drained()) {
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        if (!result.timed_out && now >= deadline) {
            result.timed_out = true;
            process.Terminate();
            AppendLog(job, "\n[install timed out after " + std::to_string(options_.timeout.count()) + "s]\n");
            dirty = true;
        }
        if (dirty && throttler_.ShouldEmit(job, now)) {
            Emit(job, sink, now);
            dirty = false;
        }
    }

    const auto exit_code = process.Wait();
    result.exit_code = result.timed_out ? 124 : exit_code;
    result.success = !result.timed_out && exit_code == 0;
}

InstallResult InstallJobRunner::Install(const Sandbox& sandbox,
                                        const std::vector<std::string>& packages,
                                        const LogSink& sink) const {
    InstallJob job{};
    job.user_id = sandbox.user_id;
    job.packages = packages;
    job.started_at = std::chrono::steady_clock::now();

    InstallResult result{};
    const auto name = ContainerRuntime::NewContainerName("ilbox-pip");
    utils::LogInfo("install", "start user=" + sandbox.user_id + " container=" + name +
                   " packages=" + utils::Join(packages, ","));
    try {
        if (options_.ensure_image) {
            runtime_.EnsureImage(true);
        }
        PreparePackagesDir(sandbox);
        const auto args = runtime_.BuildRunArgs(BuildLaunchSpec(sandbox, packages, name));
        RunJob(job, result, args, sink);
    } catch (const SandboxError& ex) {
        AppendLog(job, std::string("\n[install failed: ") + ex.what() + "]\n");
        result.success = false;
        utils::LogError("install", "user=" + sandbox.user_id + " " + ex.what());
    }
    runtime_.RemoveContainer(name);

    if (!result.success && !result.timed_out && result.exit_code > 0) {
        AppendLog(job, "\n[pip exited with status " + std::to_string(result.exit_code) + "]\n");
    }
    job.terminal = true;
    job.success = result.success;
    Emit(job, sink, std::chrono::steady_clock::now());

    result.log = job.log;
    utils::LogInfo("install", "done user=" + sandbox.user_id + " success=" + (result.success ? "true" : "false") +
                   " exit=" + std::to_string(result.exit_code));
    return result;
}

}  // namespace ilbox::sandbox
