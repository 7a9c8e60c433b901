#include <atomic>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

#include "config/config_loader.hpp"
#include "gateway/http_gateway.hpp"
#include "sandbox/container_runtime.hpp"
#include "sandbox/expiry_reaper.hpp"
#include "sandbox/lock_table.hpp"
#include "sandbox/requests.hpp"
#include "sandbox/sandbox_error.hpp"
#include "sandbox/sandbox_registry.hpp"
#include "sandbox/sandbox_service.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

// Everything a command needs, wired once from the loaded config.
struct Engine {
    explicit Engine(const ilbox::config::Config& config)
        : registry(config.sandbox.base_dir)
        , runtime(config.runtime, config.limits.user)
        , service(registry, locks, runtime, ilbox::sandbox::ServiceOptions::FromConfig(config)) {}

    ilbox::sandbox::SandboxRegistry registry;
    ilbox::sandbox::LockTable locks;
    ilbox::sandbox::ContainerRuntime runtime;
    ilbox::sandbox::SandboxService service;
};

std::filesystem::path GetPidFilePath(const ilbox::sandbox::SandboxRegistry& registry) {
    return registry.BaseDir() / "gateway.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(const std::filesystem::path& path, pid_t pid) {
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

// Per-user locks live in the gateway process; a second process mutating the
// same base directory would bypass them.
std::optional<pid_t> RunningGateway(const Engine& engine) {
    const auto pid = ReadPidFile(GetPidFilePath(engine.registry));
    if (pid && IsProcessRunning(*pid) && *pid != ::getpid()) {
        return pid;
    }
    return std::nullopt;
}

void HandleSignal(int signal) {
    g_signal = signal;
}

std::string ReadStdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

void PrintSandbox(const ilbox::sandbox::Sandbox& sandbox) {
    const auto now = std::chrono::system_clock::now();
    const auto idle = std::chrono::duration_cast<std::chrono::seconds>(now - sandbox.last_used_at).count();
    std::cout << "user: " << sandbox.user_id << "\n"
              << "root: " << sandbox.root.string() << "\n"
              << "idle: " << idle << "s" << std::endl;
    if (sandbox.size_bytes) {
        std::cout << "size: " << *sandbox.size_bytes << " B" << std::endl;
    }
}

int RunGateway(const ilbox::config::Config& config) {
    Engine engine(config);
    const auto pid_path = GetPidFilePath(engine.registry);
    if (const auto existing = RunningGateway(engine)) {
        std::cout << "ilbox gateway already running (pid=" << *existing << ")" << std::endl;
        return 1;
    }
    RemovePidFile(pid_path);
    if (!WritePidFile(pid_path, ::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }

    engine.registry.Reconcile();
    if (config.runtime.pull_on_startup) {
        try {
            engine.service.PrepareImage();
        } catch (const ilbox::sandbox::SandboxError& ex) {
            // Runs will retry the pull when the image is still missing.
            ilbox::utils::LogWarn("gateway", std::string("image pre-pull failed: ") + ex.what());
        }
    }

    ilbox::sandbox::ExpiryReaper reaper(
        engine.registry,
        engine.locks,
        std::chrono::seconds(config.sandbox.retention_s),
        std::chrono::seconds(config.sandbox.sweep_interval_s));
    ilbox::gateway::HttpGateway http_gateway(engine.service, config.gateway);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_gateway, &listen_failed]() {
        if (!http_gateway.Listen()) {
            listen_failed.store(true);
        }
    });
    reaper.Start();

    std::cout << "ilbox gateway started on " << config.gateway.host << ":" << config.gateway.port
              << ". Press Ctrl+C to stop." << std::endl;
    bool shutdown_guard_started = false;
    while (g_running.load()) {
        if (g_signal != 0 || listen_failed.load()) {
            g_running.store(false);
            if (!shutdown_guard_started) {
                shutdown_guard_started = true;
                // Running installs can take minutes; do not wait on them forever.
                std::thread([] {
                    std::this_thread::sleep_for(std::chrono::seconds(10));
                    std::_Exit(130);
                }).detach();
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    http_gateway.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    reaper.Stop();
    RemovePidFile(pid_path);
    return listen_failed.load() ? 1 : 0;
}

int RunCommand(const std::string& command, const std::vector<std::string>& args,
               const ilbox::config::Config& config) {
    namespace sb = ilbox::sandbox;
    Engine engine(config);
    auto& service = engine.service;

    if (command == "health") {
        const auto status = service.HealthCheck();
        std::cout << "runtime: " << (status.runtime_reachable ? "reachable" : "unreachable") << "\n"
                  << "image " << engine.runtime.Image() << ": " << (status.image_present ? "present" : "missing")
                  << "\n" << status.message << std::endl;
        return status.runtime_reachable && status.image_present ? 0 : 1;
    }

    if (const auto pid = RunningGateway(engine)) {
        std::cout << "ilbox gateway is running (pid=" << *pid << "); use its HTTP API instead." << std::endl;
        return 1;
    }

    if (command == "reap") {
        engine.registry.Reconcile();
        ilbox::sandbox::ExpiryReaper reaper(
            engine.registry,
            engine.locks,
            std::chrono::seconds(config.sandbox.retention_s),
            std::chrono::seconds(config.sandbox.sweep_interval_s));
        const auto stats = reaper.SweepOnce();
        std::cout << "expired: " << stats.expired << ", deleted: " << stats.deleted
                  << ", skipped: " << stats.skipped << std::endl;
        return 0;
    }

    if (args.empty()) {
        std::cout << "Missing user id." << std::endl;
        return 2;
    }
    const auto& user_id = args[0];

    if (command == "create") {
        const auto sandbox = service.Create(user_id);
        std::cout << "Sandbox created at " << sandbox.root.string() << std::endl;
        return 0;
    }
    if (command == "delete") {
        service.DeleteSandbox(user_id);
        std::cout << "Sandbox deleted." << std::endl;
        return 0;
    }
    if (command == "info") {
        PrintSandbox(service.Info(user_id));
        return 0;
    }
    if (command == "run") {
        const auto request = sb::MakeRunRequest(user_id, ReadStdin(), args.size() > 1 ? args[1] : std::string());
        const auto outcome = service.Run(request);
        std::cout << outcome.formatted.text << std::endl;
        if (!outcome.formatted.is_inline) {
            std::cout << outcome.formatted.note << std::endl;
            std::ofstream attachment(outcome.formatted.attachment_name, std::ios::binary | std::ios::trunc);
            attachment << outcome.formatted.attachment;
            if (!attachment) {
                std::cout << "Failed to write " << outcome.formatted.attachment_name << std::endl;
                return 1;
            }
            std::cout << "Full output written to " << outcome.formatted.attachment_name << std::endl;
        }
        return outcome.result.exit_code == 0 ? 0 : 1;
    }
    if (command == "ls") {
        long long page = 0;
        if (args.size() > 2) {
            try {
                page = std::stoll(args[2]) - 1;
            } catch (const std::logic_error&) {
                std::cout << "Page must be a number." << std::endl;
                return 2;
            }
        }
        const auto request = sb::MakeListRequest(user_id, args.size() > 1 ? args[1] : std::string(), page);
        const auto listing = service.ListDirectory(request);
        std::cout << "cwd: /" << (listing.cwd == "." ? "" : listing.cwd) << "\n";
        for (const auto& entry : listing.entries) {
            std::cout << entry.name;
            if (entry.is_directory) {
                std::cout << "/";
            } else {
                std::cout << " (" << entry.size_bytes << " B)";
            }
            std::cout << "\n";
        }
        std::cout << "Page " << listing.page + 1 << "/" << listing.total_pages << std::endl;
        return 0;
    }
    if (command == "write") {
        if (args.size() < 2) {
            std::cout << "Usage: ilbox write <user> <path>  (content on stdin)" << std::endl;
            return 2;
        }
        const auto request = sb::MakeWriteRequest(user_id, args[1], ReadStdin());
        const auto bytes = service.WriteFile(request);
        std::cout << "Wrote " << request.path << " (" << bytes << " bytes)." << std::endl;
        return 0;
    }
    if (command == "rm") {
        if (args.size() < 2) {
            std::cout << "Usage: ilbox rm <user> <path> [-r]" << std::endl;
            return 2;
        }
        const bool recursive = args.size() > 2 && (args[2] == "-r" || args[2] == "--recursive");
        service.RemoveEntry(sb::MakeRemoveRequest(user_id, args[1], recursive));
        std::cout << "Removed." << std::endl;
        return 0;
    }
    if (command == "pip") {
        const std::vector<std::string> packages(args.begin() + 1, args.end());
        const auto request = sb::MakeInstallRequest(user_id, packages);
        const auto& formatter = service.Formatter();
        const auto result = service.InstallPackages(request, [&formatter](const sb::LogUpdate& update) {
            std::cout << "----- " << (update.final ? (update.success ? "done" : "failed") : "installing")
                      << " -----\n" << formatter.LogTail(update.snapshot) << std::endl;
        });
        return result.success ? 0 : 1;
    }

    std::cout << "Unknown command: " << command << std::endl;
    return 2;
}

void PrintUsage() {
    std::cout << "Usage: ilbox <command> [args]\n"
              << "  gateway                      serve the HTTP API and run the reaper\n"
              << "  health                       check the container engine and image\n"
              << "  reap                         delete expired sandboxes once\n"
              << "  create <user>\n"
              << "  delete <user>\n"
              << "  info <user>\n"
              << "  run <user> [workdir]         code on stdin\n"
              << "  ls <user> [path] [page]\n"
              << "  write <user> <path>          content on stdin\n"
              << "  rm <user> <path> [-r]\n"
              << "  pip <user> <package>..." << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage();
        return 0;
    }
    const std::vector<std::string> args(argv + 2, argv + argc);

    const auto config = ilbox::config::LoadConfig();
    ilbox::utils::LogConfig log_config{};
    log_config.min_level = ilbox::utils::LogLevelFromString(config.logging.level);
    ilbox::utils::ConfigureLogging(log_config);

    try {
        if (command == "gateway") {
            return RunGateway(config);
        }
        return RunCommand(command, args, config);
    } catch (const ilbox::sandbox::SandboxError& ex) {
        std::cout << "Error (" << ilbox::sandbox::ToString(ex.Code()) << "): " << ex.what() << std::endl;
        return ex.Code() == ilbox::sandbox::ErrorCode::kInvalidRequest ? 2 : 1;
    }
}
