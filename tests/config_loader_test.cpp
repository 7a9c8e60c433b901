#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "test_support.hpp"
#include "utils/logging.hpp"

using ilbox::config::ApplyConfigFromEnv;
using ilbox::config::ApplyConfigFromJson;
using ilbox::config::Config;
using ilbox::test_support::TempDir;
using ilbox::test_support::WriteText;

namespace {

// Sets environment variables for one test and clears them afterwards.
class ScopedEnv {
public:
    ScopedEnv& Set(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
        names_.push_back(name);
        return *this;
    }
    ~ScopedEnv() {
        for (const auto& name : names_) {
            ::unsetenv(name.c_str());
        }
    }

private:
    std::vector<std::string> names_;
};

}  // namespace

// NOLINTNEXTLINE
TEST(config_loader, defaults) {
    const Config config{};
    EXPECT_EQ(config.sandbox.retention_s, 7LL * 24 * 3600);
    EXPECT_EQ(config.limits.timeout_s, 30);
    EXPECT_EQ(config.limits.memory, "256m");
    EXPECT_EQ(config.limits.cpus, "1.0");
    EXPECT_EQ(config.limits.pids_limit, 64);
    EXPECT_EQ(config.install.timeout_s, 600);
    EXPECT_EQ(config.install.log_interval_ms, 3000);
    EXPECT_EQ(config.output.inline_limit, 1900u);
}

// NOLINTNEXTLINE
TEST(config_loader, json_overlays_known_keys) {
    Config config{};
    const auto data = nlohmann::json::parse(R"({
        "sandbox": {"baseDir": "/srv/il", "retentionS": 3600},
        "runtime": {"binary": "podman", "image": "python:3.12-slim", "pullOnStartup": false},
        "limits": {"timeoutS": 10, "memory": "128m", "pidsLimit": 32, "user": "2000:2000"},
        "install": {"logIntervalMs": 1000},
        "gateway": {"port": 9000},
        "logging": {"level": "debug"},
        "unknown": {"ignored": true}
    })");
    ApplyConfigFromJson(config, data);
    EXPECT_EQ(config.sandbox.base_dir, "/srv/il");
    EXPECT_EQ(config.sandbox.retention_s, 3600);
    EXPECT_EQ(config.runtime.binary, "podman");
    EXPECT_EQ(config.runtime.image, "python:3.12-slim");
    EXPECT_FALSE(config.runtime.pull_on_startup);
    EXPECT_EQ(config.limits.timeout_s, 10);
    EXPECT_EQ(config.limits.memory, "128m");
    EXPECT_EQ(config.limits.pids_limit, 32);
    EXPECT_EQ(config.limits.user, "2000:2000");
    EXPECT_EQ(config.limits.cpus, "1.0");
    EXPECT_EQ(config.install.log_interval_ms, 1000);
    EXPECT_EQ(config.gateway.port, 9000);
    EXPECT_EQ(config.logging.level, "debug");
}

// NOLINTNEXTLINE
TEST(config_loader, json_with_wrong_types_keeps_defaults) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"limits": {"timeoutS": "fast", "memory": 5}})"));
    EXPECT_EQ(config.limits.timeout_s, 30);
    EXPECT_EQ(config.limits.memory, "256m");
}

// NOLINTNEXTLINE
TEST(config_loader, env_overrides_and_legacy_names) {
    ScopedEnv env;
    env.Set("ILBOX_LIMITS__TIMEOUT_S", "12")
       .Set("IL_TIMEOUT_SECONDS", "99")
       .Set("IL_MEMORY", "512m")
       .Set("SANDBOX_IMAGE", "python:3.11-slim")
       .Set("SANDBOX_PULL_ON_STARTUP", "false")
       .Set("IL_RETENTION_SECONDS", "120")
       .Set("ILBOX_GATEWAY__PORT", "not-a-number");
    Config config{};
    ApplyConfigFromEnv(config);
    EXPECT_EQ(config.limits.timeout_s, 12);
    EXPECT_EQ(config.limits.memory, "512m");
    EXPECT_EQ(config.runtime.image, "python:3.11-slim");
    EXPECT_FALSE(config.runtime.pull_on_startup);
    EXPECT_EQ(config.sandbox.retention_s, 120);
    EXPECT_EQ(config.gateway.port, 8790);
}

// NOLINTNEXTLINE
TEST(config_loader, malformed_file_keeps_defaults) {
    TempDir dir;
    const auto path = dir.Path() / "config.json";
    WriteText(path, "{ not json");
    ScopedEnv env;
    env.Set("ILBOX_CONFIG", path.string());
    const auto config = ilbox::config::LoadConfig();
    EXPECT_EQ(ilbox::config::GetConfigPath(), path);
    EXPECT_EQ(config.limits.timeout_s, 30);
}

// NOLINTNEXTLINE
TEST(config_loader, file_then_env) {
    TempDir dir;
    const auto path = dir.Path() / "config.json";
    WriteText(path, R"({"limits": {"timeoutS": 5, "cpus": "0.5"}})");
    ScopedEnv env;
    env.Set("ILBOX_CONFIG", path.string()).Set("ILBOX_LIMITS__CPUS", "2");
    const auto config = ilbox::config::LoadConfig();
    EXPECT_EQ(config.limits.timeout_s, 5);
    EXPECT_EQ(config.limits.cpus, "2");
}

// NOLINTNEXTLINE
TEST(config_loader, log_level_names) {
    using ilbox::utils::LogLevel;
    EXPECT_EQ(ilbox::utils::LogLevelFromString("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(ilbox::utils::LogLevelFromString("warning"), LogLevel::kWarn);
    EXPECT_EQ(ilbox::utils::LogLevelFromString("error"), LogLevel::kError);
    EXPECT_EQ(ilbox::utils::LogLevelFromString("chatty"), LogLevel::kInfo);
}

// NOLINTNEXTLINE
TEST(config_loader, out_of_range_numbers_keep_defaults) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({
        "sandbox": {"retentionS": -5, "sweepIntervalS": 0},
        "runtime": {"pullTimeoutS": 1e300},
        "limits": {"timeoutS": -1, "pidsLimit": 4294967296, "maxOutputBytes": -1},
        "install": {"timeoutS": 0, "maxLogBytes": 1e30},
        "gateway": {"port": 70000}
    })"));
    EXPECT_EQ(config.sandbox.retention_s, 7LL * 24 * 3600);
    EXPECT_EQ(config.sandbox.sweep_interval_s, 3600);
    EXPECT_EQ(config.runtime.pull_timeout_s, 300);
    EXPECT_EQ(config.limits.timeout_s, 30);
    EXPECT_EQ(config.limits.pids_limit, 64);
    EXPECT_EQ(config.limits.max_output_bytes, 100000u);
    EXPECT_EQ(config.install.timeout_s, 600);
    EXPECT_EQ(config.install.max_log_bytes, 1024u * 1024u);
    EXPECT_EQ(config.gateway.port, 8790);

    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"sandbox": {"retentionS": 0}, "gateway": {"port": 65535}})"));
    EXPECT_EQ(config.sandbox.retention_s, 0);
    EXPECT_EQ(config.gateway.port, 65535);

    ScopedEnv env;
    env.Set("ILBOX_SANDBOX__SWEEP_INTERVAL_S", "0")
       .Set("ILBOX_LIMITS__TIMEOUT_S", "1e20")
       .Set("ILBOX_LIMITS__MAX_OUTPUT_BYTES", "-3")
       .Set("ILBOX_INSTALL__LOG_INTERVAL_MS", "nan")
       .Set("ILBOX_GATEWAY__PORT", "0");
    Config from_env{};
    ApplyConfigFromEnv(from_env);
    EXPECT_EQ(from_env.sandbox.sweep_interval_s, 3600);
    EXPECT_EQ(from_env.limits.timeout_s, 30);
    EXPECT_EQ(from_env.limits.max_output_bytes, 100000u);
    EXPECT_EQ(from_env.install.log_interval_ms, 3000);
    EXPECT_EQ(from_env.gateway.port, 8790);
}

// NOLINTNEXTLINE
TEST(config_loader, echo_last_expr_switch) {
    Config config{};
    EXPECT_TRUE(config.limits.echo_last_expr);
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"limits": {"echoLastExpr": false}})"));
    EXPECT_FALSE(config.limits.echo_last_expr);

    {
        ScopedEnv env;
        env.Set("ECHO_LAST_EXPR", "1");
        ApplyConfigFromEnv(config);
        EXPECT_TRUE(config.limits.echo_last_expr);
    }
    for (const char* off : {"0", "false", "False"}) {
        ScopedEnv env;
        env.Set("ILBOX_LIMITS__ECHO_LAST_EXPR", off).Set("ECHO_LAST_EXPR", "1");
        Config fresh{};
        ApplyConfigFromEnv(fresh);
        EXPECT_FALSE(fresh.limits.echo_last_expr) << off;
    }
}
