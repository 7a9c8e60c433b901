#pragma once

#include <cstddef>
#include <string>

namespace ilbox::config {

struct SandboxConfig {
    std::string base_dir = "./il_sandboxes";
    long long retention_s = 7LL * 24 * 3600;
    int sweep_interval_s = 3600;
};

struct RuntimeConfig {
    std::string binary = "docker";
    std::string image = "python:3.11-alpine";
    bool pull_on_startup = true;
    int pull_timeout_s = 300;
};

struct LimitsConfig {
    int timeout_s = 30;
    std::string memory = "256m";
    std::string cpus = "1.0";
    int pids_limit = 64;
    std::string tmpfs_size = "64m";
    std::string user = "1000:1000";
    std::size_t max_output_bytes = 100000;
    // Print the repr of a trailing bare expression, as an interactive shell would.
    bool echo_last_expr = true;
};

struct InstallConfig {
    int timeout_s = 600;
    int log_interval_ms = 3000;
    // Oldest output is dropped past this many bytes; 0 keeps everything.
    std::size_t max_log_bytes = 1024 * 1024;
};

struct OutputConfig {
    std::size_t inline_limit = 1900;
    std::size_t preview_chars = 1800;
    std::size_t log_tail_chars = 1800;
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 8790;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    RuntimeConfig runtime;
    LimitsConfig limits;
    InstallConfig install;
    OutputConfig output;
    GatewayConfig gateway;
    LoggingConfig logging;
};

}  // namespace ilbox::config
