#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include "utils/logging.hpp"

namespace ilbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

bool IsOffFlag(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off";
}

constexpr long long kNoMax = std::numeric_limits<long long>::max();

// Values that are not finite or fall outside [min_value, max_value] keep the
// current setting.
template <typename T>
void AssignChecked(const std::string& name, double value, T& target, long long min_value, long long max_value) {
    // First value past the range of T; everything below it truncates into T.
    const double type_limit = std::ldexp(1.0, std::numeric_limits<T>::digits);
    if (!std::isfinite(value) || value < static_cast<double>(min_value) ||
        value > static_cast<double>(max_value) || value >= type_limit) {
        utils::LogWarn("config", name + " is out of range; keeping " + std::to_string(target));
        return;
    }
    target = static_cast<T>(value);
}

template <typename T>
void ReadInteger(const nlohmann::json& section, const char* key, T& target,
                 long long min_value, long long max_value = kNoMax) {
    if (section.contains(key) && section[key].is_number()) {
        AssignChecked(key, section[key].get<double>(), target, min_value, max_value);
    }
}

template <typename T>
void ReadEnvInteger(const char* name, const std::string& value, T& target,
                    long long min_value, long long max_value = kNoMax) {
    if (value.empty()) {
        return;
    }
    double parsed = 0;
    try {
        parsed = std::stod(value);
    } catch (const std::logic_error&) {
        utils::LogWarn("config", std::string(name) + " is not a number; keeping " + std::to_string(target));
        return;
    }
    AssignChecked(name, parsed, target, min_value, max_value);
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& section, const char* key, bool& target) {
    if (section.contains(key) && section[key].is_boolean()) {
        target = section[key].get<bool>();
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto custom = GetEnv("ILBOX_CONFIG");
    if (!custom.empty()) {
        return std::filesystem::path(custom);
    }
    return GetHomePath() / ".ilbox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "baseDir", config.sandbox.base_dir);
        ReadInteger(sandbox, "retentionS", config.sandbox.retention_s, 0);
        ReadInteger(sandbox, "sweepIntervalS", config.sandbox.sweep_interval_s, 1);
    }

    if (data.contains("runtime") && data["runtime"].is_object()) {
        const auto& runtime = data["runtime"];
        ReadString(runtime, "binary", config.runtime.binary);
        ReadString(runtime, "image", config.runtime.image);
        ReadBool(runtime, "pullOnStartup", config.runtime.pull_on_startup);
        ReadInteger(runtime, "pullTimeoutS", config.runtime.pull_timeout_s, 1);
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        ReadInteger(limits, "timeoutS", config.limits.timeout_s, 1);
        ReadString(limits, "memory", config.limits.memory);
        ReadString(limits, "cpus", config.limits.cpus);
        ReadInteger(limits, "pidsLimit", config.limits.pids_limit, 1);
        ReadString(limits, "tmpfsSize", config.limits.tmpfs_size);
        ReadString(limits, "user", config.limits.user);
        ReadInteger(limits, "maxOutputBytes", config.limits.max_output_bytes, 0);
        ReadBool(limits, "echoLastExpr", config.limits.echo_last_expr);
    }

    if (data.contains("install") && data["install"].is_object()) {
        const auto& install = data["install"];
        ReadInteger(install, "timeoutS", config.install.timeout_s, 1);
        ReadInteger(install, "logIntervalMs", config.install.log_interval_ms, 0);
        ReadInteger(install, "maxLogBytes", config.install.max_log_bytes, 0);
    }

    if (data.contains("output") && data["output"].is_object()) {
        const auto& output = data["output"];
        ReadInteger(output, "inlineLimit", config.output.inline_limit, 1);
        ReadInteger(output, "previewChars", config.output.preview_chars, 0);
        ReadInteger(output, "logTailChars", config.output.log_tail_chars, 0);
    }

    if (data.contains("gateway") && data["gateway"].is_object()) {
        const auto& gateway = data["gateway"];
        ReadString(gateway, "host", config.gateway.host);
        ReadInteger(gateway, "port", config.gateway.port, 1, 65535);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto base_dir = GetEnvFallback("ILBOX_SANDBOX__BASE_DIR", "IL_BASE_DIR");
    if (!base_dir.empty()) {
        config.sandbox.base_dir = base_dir;
    }

    const auto retention = GetEnvFallback("ILBOX_SANDBOX__RETENTION_S", "IL_RETENTION_SECONDS");
    ReadEnvInteger("sandbox retention", retention, config.sandbox.retention_s, 0);

    const auto sweep_interval = GetEnvFallback(
        "ILBOX_SANDBOX__SWEEP_INTERVAL_S",
        "IL_SWEEP_INTERVAL_SECONDS");
    ReadEnvInteger("sweep interval", sweep_interval, config.sandbox.sweep_interval_s, 1);

    const auto binary = GetEnvFallback("ILBOX_RUNTIME__BINARY", "DOCKER_BINARY");
    if (!binary.empty()) {
        config.runtime.binary = binary;
    }

    const auto image = GetEnvFallback("ILBOX_RUNTIME__IMAGE", "SANDBOX_IMAGE");
    if (!image.empty()) {
        config.runtime.image = image;
    }

    const auto pull_on_startup = GetEnvFallback(
        "ILBOX_RUNTIME__PULL_ON_STARTUP",
        "SANDBOX_PULL_ON_STARTUP");
    if (!pull_on_startup.empty()) {
        config.runtime.pull_on_startup = ParseBool(pull_on_startup);
    }

    const auto pull_timeout = GetEnv("ILBOX_RUNTIME__PULL_TIMEOUT_S");
    ReadEnvInteger("pull timeout", pull_timeout, config.runtime.pull_timeout_s, 1);

    const auto timeout = GetEnvFallback("ILBOX_LIMITS__TIMEOUT_S", "IL_TIMEOUT_SECONDS");
    ReadEnvInteger("run timeout", timeout, config.limits.timeout_s, 1);

    const auto memory = GetEnvFallback("ILBOX_LIMITS__MEMORY", "IL_MEMORY");
    if (!memory.empty()) {
        config.limits.memory = memory;
    }

    const auto cpus = GetEnvFallback("ILBOX_LIMITS__CPUS", "IL_CPUS");
    if (!cpus.empty()) {
        config.limits.cpus = cpus;
    }

    const auto pids_limit = GetEnvFallback("ILBOX_LIMITS__PIDS_LIMIT", "IL_PIDS_LIMIT");
    ReadEnvInteger("pids limit", pids_limit, config.limits.pids_limit, 1);

    const auto tmpfs_size = GetEnv("ILBOX_LIMITS__TMPFS_SIZE");
    if (!tmpfs_size.empty()) {
        config.limits.tmpfs_size = tmpfs_size;
    }

    const auto user = GetEnv("ILBOX_LIMITS__USER");
    if (!user.empty()) {
        config.limits.user = user;
    }

    const auto max_output = GetEnv("ILBOX_LIMITS__MAX_OUTPUT_BYTES");
    ReadEnvInteger("max output bytes", max_output, config.limits.max_output_bytes, 0);

    const auto echo_last_expr = GetEnvFallback("ILBOX_LIMITS__ECHO_LAST_EXPR", "ECHO_LAST_EXPR");
    if (!echo_last_expr.empty()) {
        config.limits.echo_last_expr = !IsOffFlag(echo_last_expr);
    }

    const auto install_timeout = GetEnvFallback("ILBOX_INSTALL__TIMEOUT_S", "IL_PIP_TIMEOUT_SECONDS");
    ReadEnvInteger("install timeout", install_timeout, config.install.timeout_s, 1);

    const auto log_interval = GetEnv("ILBOX_INSTALL__LOG_INTERVAL_MS");
    ReadEnvInteger("install log interval", log_interval, config.install.log_interval_ms, 0);

    const auto max_log = GetEnv("ILBOX_INSTALL__MAX_LOG_BYTES");
    ReadEnvInteger("install log cap", max_log, config.install.max_log_bytes, 0);

    const auto gateway_host = GetEnv("ILBOX_GATEWAY__HOST");
    if (!gateway_host.empty()) {
        config.gateway.host = gateway_host;
    }

    const auto gateway_port = GetEnv("ILBOX_GATEWAY__PORT");
    ReadEnvInteger("gateway port", gateway_port, config.gateway.port, 1, 65535);

    const auto log_level = GetEnv("ILBOX_LOGGING__LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        const auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::LogWarn("config", "failed to parse " + config_path.string() + "; using defaults");
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

}  // namespace ilbox::config
