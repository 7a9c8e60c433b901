#include "sandbox/container_runtime.hpp"

#include <boost/process.hpp>
#include <chrono>
#include <fstream>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace ilbox::sandbox {
namespace bp = boost::process;
namespace fs = std::filesystem;
namespace {

// Drains one pipe on its own thread, keeping at most `cap` bytes.
class StreamCollector {
public:
    StreamCollector(bp::ipstream& stream, std::size_t cap)
        : stream_(stream), cap_(cap) {}

    void Start() {
        worker_ = std::thread([this]() { Drain(); });
    }

    void Join() {
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    ~StreamCollector() { Join(); }

    std::string& Data() { return data_; }
    bool Truncated() const { return truncated_; }

private:
    void Drain() {
        char buffer[4096];
        while (stream_.read(buffer, sizeof(buffer)) || stream_.gcount() > 0) {
            const auto count = static_cast<std::size_t>(stream_.gcount());
            if (cap_ == 0 || data_.size() + count <= cap_) {
                data_.append(buffer, count);
            } else {
                if (data_.size() < cap_) {
                    data_.append(buffer, cap_ - data_.size());
                }
                truncated_ = true;
            }
        }
    }

    bp::ipstream& stream_;
    std::size_t cap_;
    std::string data_;
    bool truncated_ = false;
    std::thread worker_;
};

class TempFile {
public:
    explicit TempFile(const std::string& content)
        : path_(fs::temp_directory_path() / ("ilbox_stdin_" + utils::GenerateId() + ".txt")) {
        // User code must not be readable by other local accounts.
        const int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0) {
            throw SandboxError(ErrorCode::kInfrastructure, "cannot create temp file " + path_.string());
        }
        ::close(fd);
        std::ofstream output(path_, std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            throw SandboxError(ErrorCode::kInfrastructure, "cannot create temp file " + path_.string());
        }
        output << content;
    }
    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const fs::path& Path() const { return path_; }

private:
    fs::path path_;
};

}  // namespace

ContainerRuntime::ContainerRuntime(const config::RuntimeConfig& config, std::string container_user)
    : binary_(config.binary)
    , image_(config.image)
    , container_user_(std::move(container_user))
    , pull_timeout_(config.pull_timeout_s) {}

std::string ContainerRuntime::ResolveBinary() const {
    std::lock_guard<std::mutex> lock(resolve_mutex_);
    if (!resolved_binary_.empty()) {
        return resolved_binary_;
    }
    if (binary_.find('/') != std::string::npos) {
        std::error_code ec;
        if (!fs::exists(binary_, ec)) {
            throw SandboxError(ErrorCode::kInfrastructure,
                               "container engine binary '" + binary_ + "' not found");
        }
        resolved_binary_ = binary_;
        return resolved_binary_;
    }
    const auto found = bp::search_path(binary_);
    if (found.empty()) {
        throw SandboxError(ErrorCode::kInfrastructure,
                           "container engine binary '" + binary_ +
                           "' not found. Install Docker and ensure it's on PATH.");
    }
    resolved_binary_ = found.string();
    return resolved_binary_;
}

ExecutionResult ContainerRuntime::Exec(const std::vector<std::string>& args,
                                       const CommandOptions& options) const {
    const auto binary = ResolveBinary();
    ExecutionResult result{};
    TempFile input(options.input);
    bp::ipstream out_stream;
    bp::ipstream err_stream;
    StreamCollector out_collector(out_stream, options.max_output_bytes);
    StreamCollector err_collector(err_stream, options.max_output_bytes);

    const auto started = std::chrono::steady_clock::now();
    try {
        bp::group group;
        bp::child child(
            bp::exe = binary,
            bp::args = args,
            bp::std_in < input.Path().string(),
            bp::std_out > out_stream,
            bp::std_err > err_stream,
            group);
        out_collector.Start();
        err_collector.Start();

        const auto deadline = started + options.timeout;
        std::error_code ec;
        bool finished = false;
        while (true) {
            if (!child.running(ec)) {
                finished = true;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!finished) {
            result.timed_out = true;
            group.terminate(ec);
            child.wait(ec);
            result.exit_code = 124;
        } else {
            result.exit_code = DecodeExitStatus(child.native_exit_code());
        }
    } catch (const bp::process_error& ex) {
        out_stream.pipe().close();
        err_stream.pipe().close();
        throw SandboxError(ErrorCode::kInfrastructure,
                           std::string("failed to launch container engine: ") + ex.what());
    }

    out_collector.Join();
    err_collector.Join();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    result.output = std::move(out_collector.Data());
    result.error = std::move(err_collector.Data());
    result.truncated = out_collector.Truncated() || err_collector.Truncated();
    return result;
}

std::vector<std::string> ContainerRuntime::BuildRunArgs(const LaunchSpec& spec) const {
    const auto source = spec.mount_source.string();
    if (source.find(':') != std::string::npos || source.find(',') != std::string::npos) {
        throw SandboxError(ErrorCode::kInfrastructure, "mount source contains ':' or ',': " + source);
    }

    std::vector<std::string> args = {
        "run",
        "--name", spec.name,
    };
    if (spec.interactive) {
        args.push_back("-i");
    }
    if (!spec.network) {
        args.insert(args.end(), {"--network", "none"});
    }
    args.insert(args.end(), {
        "--read-only",
        "--tmpfs", "/tmp:rw,noexec,nosuid,size=" + spec.limits.tmpfs_size,
        "--pids-limit", std::to_string(spec.limits.pids_limit),
        "--cpus", spec.limits.cpus,
        "--memory", spec.limits.memory,
        "--memory-swap", spec.limits.memory,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--user", container_user_,
        "-e", "PYTHONDONTWRITEBYTECODE=1",
        "-e", "PYTHONUNBUFFERED=1",
    });
    for (const auto& [key, value] : spec.env) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }
    args.insert(args.end(), {"-v", source + ":" + spec.mount_target + ":rw"});
    if (!spec.workdir.empty()) {
        args.insert(args.end(), {"-w", spec.workdir});
    }
    args.push_back(image_);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

bool ContainerRuntime::ImagePresent() const {
    CommandOptions options;
    options.timeout = std::chrono::seconds(30);
    const auto result = Exec({"image", "inspect", image_}, options);
    return !result.timed_out && result.exit_code == 0;
}

void ContainerRuntime::EnsureImage(bool pull) const {
    if (ImagePresent()) {
        return;
    }
    if (!pull) {
        throw SandboxError(ErrorCode::kInfrastructure,
                           "image '" + image_ + "' not found locally and pulling is disabled (image not pulled)");
    }
    utils::LogInfo("runtime", "pulling image " + image_);
    CommandOptions options;
    options.timeout = pull_timeout_;
    options.max_output_bytes = 64 * 1024;
    const auto result = Exec({"pull", image_}, options);
    if (result.timed_out) {
        throw SandboxError(ErrorCode::kInfrastructure,
                           "timed out pulling image '" + image_ + "'. Try pulling manually.");
    }
    if (result.exit_code != 0) {
        throw SandboxError(ErrorCode::kInfrastructure,
                           "failed to pull image '" + image_ + "'. Check engine connectivity.");
    }
    utils::LogInfo("runtime", "image ready " + image_);
}

HealthStatus ContainerRuntime::Health() const {
    HealthStatus status{};
    CommandOptions options;
    options.timeout = std::chrono::seconds(15);
    options.max_output_bytes = 4096;
    try {
        const auto version = Exec({"version", "--format", "{{.Server.Version}}"}, options);
        status.runtime_reachable = !version.timed_out && version.exit_code == 0;
        if (!status.runtime_reachable) {
            status.message = "container engine unreachable: " + utils::Trim(version.error);
            return status;
        }
        status.image_present = ImagePresent();
        status.message = status.image_present
            ? "engine reachable, image present: " + image_
            : "engine reachable, image missing: " + image_ + " (image not pulled)";
    } catch (const SandboxError& ex) {
        status.message = ex.what();
    }
    return status;
}

bool ContainerRuntime::WasOomKilled(const std::string& container_name) const {
    CommandOptions options;
    options.timeout = std::chrono::seconds(15);
    options.max_output_bytes = 4096;
    const auto result = Exec({"inspect", "--format", "{{.State.OOMKilled}}", container_name}, options);
    return result.exit_code == 0 && utils::Trim(result.output) == "true";
}

void ContainerRuntime::RemoveContainer(const std::string& container_name) const {
    CommandOptions options;
    options.timeout = std::chrono::seconds(30);
    options.max_output_bytes = 4096;
    try {
        const auto result = Exec({"rm", "-f", container_name}, options);
        if (result.exit_code != 0) {
            utils::LogWarn("runtime", "rm -f " + container_name + " exit=" + std::to_string(result.exit_code) +
                           " " + utils::Trim(result.error));
        }
    } catch (const SandboxError& ex) {
        utils::LogWarn("runtime", "rm -f " + container_name + " failed: " + ex.what());
    }
}

int ContainerRuntime::DecodeExitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}

std::string ContainerRuntime::NewContainerName(const std::string& prefix) {
    return prefix + "-" + utils::GenerateId(12);
}

}  // namespace ilbox::sandbox
