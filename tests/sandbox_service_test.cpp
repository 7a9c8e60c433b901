#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "sandbox/sandbox_error.hpp"
#include "sandbox/sandbox_service.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using ilbox::sandbox::ContainerRuntime;
using ilbox::sandbox::ErrorCode;
using ilbox::sandbox::LockTable;
using ilbox::sandbox::LogUpdate;
using ilbox::sandbox::SandboxError;
using ilbox::sandbox::SandboxRegistry;
using ilbox::sandbox::SandboxService;
using ilbox::sandbox::ServiceOptions;
using ilbox::test_support::ReadText;
using ilbox::test_support::TempDir;
using ilbox::test_support::WriteFakeEngine;
using ilbox::test_support::WriteText;
namespace sb = ilbox::sandbox;

namespace {

template <typename Fn>
ErrorCode CodeOf(Fn&& fn) {
    try {
        fn();
    } catch (const SandboxError& ex) {
        return ex.Code();
    }
    ADD_FAILURE() << "expected a SandboxError";
    return ErrorCode::kStorage;
}

class ServiceFixture : public ::testing::Test {
protected:
    void SetUp() override {
        engine_ = WriteFakeEngine(dir_.Path());
        registry_ = std::make_unique<SandboxRegistry>(dir_.Path() / "base");
        runtime_ = std::make_unique<ContainerRuntime>(ilbox::test_support::FakeRuntimeConfig(engine_), "1000:1000");
        options_.run_timeout = 10s;
        options_.log_interval = 3000ms;
    }

    SandboxService& Service() {
        if (!service_) {
            service_ = std::make_unique<SandboxService>(*registry_, locks_, *runtime_, options_);
        }
        return *service_;
    }

    TempDir dir_;
    fs::path engine_;
    std::unique_ptr<SandboxRegistry> registry_;
    LockTable locks_;
    std::unique_ptr<ContainerRuntime> runtime_;
    ServiceOptions options_;
    std::unique_ptr<SandboxService> service_;
};

}  // namespace

// NOLINTNEXTLINE
TEST_F(ServiceFixture, full_lifecycle) {
    auto& service = Service();
    const auto sandbox = service.Create("alice");
    EXPECT_EQ(CodeOf([&] { service.Create("alice"); }), ErrorCode::kAlreadyExists);

    const auto outcome = service.Run(sb::MakeRunRequest("alice", "```python\necho hello > out.txt\necho ran\n```"));
    EXPECT_EQ(outcome.result.exit_code, 0);
    EXPECT_EQ(outcome.result.output, "ran\n");
    EXPECT_TRUE(outcome.formatted.is_inline);
    EXPECT_NE(outcome.formatted.text.find("ran"), std::string::npos);
    EXPECT_EQ(ReadText(sandbox.root / "out.txt"), "hello\n");

    auto page = service.ListDirectory(sb::MakeListRequest("alice", "", 0));
    EXPECT_EQ(page.cwd, ".");
    ASSERT_EQ(page.entries.size(), 2u);
    EXPECT_EQ(page.entries[0].name, ".site-packages");
    EXPECT_TRUE(page.entries[0].is_directory);
    EXPECT_EQ(page.entries[1].name, "out.txt");
    EXPECT_EQ(page.entries[1].size_bytes, 6u);

    EXPECT_EQ(service.WriteFile(sb::MakeWriteRequest("alice", "out.txt", "hi")), 2u);
    page = service.ListDirectory(sb::MakeListRequest("alice", "", 0));
    EXPECT_EQ(page.entries[1].size_bytes, 2u);

    service.RemoveEntry(sb::MakeRemoveRequest("alice", "out.txt", false));
    EXPECT_FALSE(fs::exists(sandbox.root / "out.txt"));

    service.DeleteSandbox("alice");
    EXPECT_FALSE(fs::exists(sandbox.root));
    EXPECT_EQ(CodeOf([&] { service.Info("alice"); }), ErrorCode::kNotFound);
    EXPECT_EQ(CodeOf([&] { service.DeleteSandbox("alice"); }), ErrorCode::kNotFound);
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, operations_on_missing_sandbox_report_not_found) {
    auto& service = Service();
    try {
        service.Run(sb::MakeRunRequest("ghost", "echo hi"));
        FAIL() << "expected an error";
    } catch (const SandboxError& ex) {
        EXPECT_EQ(ex.Code(), ErrorCode::kNotFound);
        EXPECT_EQ(std::string(ex.what()), "No sandbox found or it expired");
    }
    EXPECT_EQ(CodeOf([&] { service.ListDirectory(sb::MakeListRequest("ghost", "", 0)); }), ErrorCode::kNotFound);
    EXPECT_EQ(CodeOf([&] { service.WriteFile(sb::MakeWriteRequest("ghost", "a", "b")); }), ErrorCode::kNotFound);
    EXPECT_FALSE(fs::exists(dir_.Path() / "base" / "ghost"));
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, concurrent_run_is_busy_but_files_stay_available) {
    auto& service = Service();
    service.Create("alice");

    std::thread slow([&service] {
        const auto outcome = service.Run(sb::MakeRunRequest("alice", "sleep 2\necho slow"));
        EXPECT_EQ(outcome.result.output, "slow\n");
    });
    std::this_thread::sleep_for(500ms);
    EXPECT_EQ(CodeOf([&] { service.Run(sb::MakeRunRequest("alice", "echo fast")); }), ErrorCode::kSandboxBusy);
    EXPECT_EQ(CodeOf([&] { service.InstallPackages(sb::MakeInstallRequest("alice", "requests"), nullptr); }),
              ErrorCode::kSandboxBusy);
    EXPECT_EQ(service.WriteFile(sb::MakeWriteRequest("alice", "during.txt", "ok")), 2u);
    slow.join();

    EXPECT_EQ(service.Run(sb::MakeRunRequest("alice", "cat during.txt")).result.output, "ok");
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, other_users_run_in_parallel) {
    auto& service = Service();
    service.Create("alice");
    service.Create("bob");

    std::thread slow([&service] { service.Run(sb::MakeRunRequest("alice", "sleep 1")); });
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(service.Run(sb::MakeRunRequest("bob", "echo bob")).result.output, "bob\n");
    slow.join();
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, timeout_is_reported_and_counts_as_activity) {
    options_.run_timeout = 1s;
    auto& service = Service();
    const auto created = service.Create("alice");
    const auto outcome = service.Run(sb::MakeRunRequest("alice", "echo partial\nsleep 10"));
    EXPECT_TRUE(outcome.result.timed_out);
    EXPECT_NE(outcome.formatted.text.find("partial"), std::string::npos);
    EXPECT_GT(registry_->Get("alice").last_used_at, created.last_used_at);
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, expired_sandbox_is_removed_on_access) {
    options_.retention = 0s;
    auto& service = Service();
    const auto sandbox = service.Create("alice");
    WriteText(sandbox.root / "old.txt", "stale");

    EXPECT_EQ(CodeOf([&] { service.Run(sb::MakeRunRequest("alice", "echo hi")); }), ErrorCode::kNotFound);
    EXPECT_FALSE(fs::exists(sandbox.root));
    EXPECT_FALSE(registry_->Find("alice").has_value());

    service.Create("alice");
    EXPECT_EQ(CodeOf([&] { service.ListDirectory(sb::MakeListRequest("alice", "", 0)); }), ErrorCode::kNotFound);
    EXPECT_FALSE(registry_->Find("alice").has_value());

    // Creating over an expired record replaces it.
    service.Create("alice");
    EXPECT_NO_THROW(service.Create("alice"));
    EXPECT_TRUE(fs::is_directory(sandbox.root / ".site-packages"));
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, file_operation_errors) {
    auto& service = Service();
    const auto sandbox = service.Create("alice");
    WriteText(sandbox.root / "dir" / "nested.txt", "x");
    WriteText(sandbox.root / "plain.txt", "x");

    EXPECT_EQ(CodeOf([&] { service.RemoveEntry(sb::MakeRemoveRequest("alice", "dir", false)); }),
              ErrorCode::kNotEmpty);
    EXPECT_TRUE(fs::exists(sandbox.root / "dir" / "nested.txt"));
    EXPECT_EQ(CodeOf([&] { service.RemoveEntry(sb::MakeRemoveRequest("alice", ".", true)); }),
              ErrorCode::kInvalidRequest);
    EXPECT_EQ(CodeOf([&] { service.RemoveEntry(sb::MakeRemoveRequest("alice", "nope", false)); }),
              ErrorCode::kPathNotFound);
    EXPECT_EQ(CodeOf([&] { service.WriteFile(sb::MakeWriteRequest("alice", "dir", "x")); }),
              ErrorCode::kInvalidRequest);
    EXPECT_EQ(CodeOf([&] { service.WriteFile(sb::MakeWriteRequest("alice", "../escape.txt", "x")); }),
              ErrorCode::kPathEscape);
    EXPECT_FALSE(fs::exists(dir_.Path() / "base" / "escape.txt"));
    EXPECT_EQ(CodeOf([&] { service.ListDirectory(sb::MakeListRequest("alice", "plain.txt", 0)); }),
              ErrorCode::kInvalidRequest);
    EXPECT_EQ(CodeOf([&] { service.ListDirectory(sb::MakeListRequest("alice", "missing", 0)); }),
              ErrorCode::kPathNotFound);

    service.RemoveEntry(sb::MakeRemoveRequest("alice", "dir", true));
    EXPECT_FALSE(fs::exists(sandbox.root / "dir"));
    EXPECT_TRUE(fs::exists(sandbox.root));
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, write_creates_parent_directories) {
    auto& service = Service();
    const auto sandbox = service.Create("alice");
    service.WriteFile(sb::MakeWriteRequest("alice", "a/b/c.txt", "deep"));
    EXPECT_EQ(ReadText(sandbox.root / "a" / "b" / "c.txt"), "deep");

    const auto page = service.ListDirectory(sb::MakeListRequest("alice", "a/b", 0));
    EXPECT_EQ(page.cwd, "a/b");
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_EQ(page.entries[0].name, "c.txt");
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, listing_is_sorted_and_paged) {
    auto& service = Service();
    const auto sandbox = service.Create("alice");
    fs::create_directories(sandbox.root / "many" / "Beta");
    fs::create_directories(sandbox.root / "many" / "alpha");
    for (int i = 0; i < 25; ++i) {
        const auto name = std::string(i < 10 ? "f0" : "f") + std::to_string(i);
        WriteText(sandbox.root / "many" / name, "x");
    }

    auto page = service.ListDirectory(sb::MakeListRequest("alice", "many", 0));
    EXPECT_EQ(page.cwd, "many");
    EXPECT_EQ(page.total_entries, 27u);
    EXPECT_EQ(page.total_pages, 2u);
    ASSERT_EQ(page.entries.size(), 20u);
    EXPECT_EQ(page.entries[0].name, "alpha");
    EXPECT_EQ(page.entries[1].name, "Beta");
    EXPECT_EQ(page.entries[2].name, "f00");
    EXPECT_EQ(page.entries[19].name, "f17");

    page = service.ListDirectory(sb::MakeListRequest("alice", "many", 1));
    ASSERT_EQ(page.entries.size(), 7u);
    EXPECT_EQ(page.entries.back().name, "f24");

    page = service.ListDirectory(sb::MakeListRequest("alice", "many", 9));
    EXPECT_EQ(page.page, 1u);
    EXPECT_EQ(page.entries.size(), 7u);
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, info_measures_size_without_touching) {
    auto& service = Service();
    const auto sandbox = service.Create("alice");
    service.WriteFile(sb::MakeWriteRequest("alice", "data.bin", std::string(1000, 'x')));
    const auto before = registry_->Get("alice").last_used_at;

    const auto info = service.Info("alice");
    ASSERT_TRUE(info.size_bytes.has_value());
    EXPECT_GE(*info.size_bytes, 1000u);
    EXPECT_EQ(info.root, sandbox.root);
    EXPECT_EQ(registry_->Get("alice").last_used_at, before);
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, install_through_service) {
    auto& service = Service();
    const auto sandbox = service.Create("alice");

    std::vector<LogUpdate> updates;
    const auto result = service.InstallPackages(sb::MakeInstallRequest("alice", "requests numpy"),
                                                [&updates](const LogUpdate& update) { updates.push_back(update); });
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(fs::exists(sandbox.root / ".site-packages" / "numpy.installed"));
    ASSERT_FALSE(updates.empty());
    EXPECT_TRUE(updates.back().final);
    EXPECT_NE(service.Formatter().LogTail(updates.back().snapshot).find("Successfully installed"), std::string::npos);
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, file_operations_hold_against_directories_swapped_for_links) {
    auto& service = Service();
    const auto sandbox = service.Create("alice");
    const auto outside = dir_.Path() / "outside";
    WriteText(outside / "keep.txt", "keep");
    fs::create_directories(sandbox.root / "d");
    fs::create_directory_symlink(outside, sandbox.root / "link");

    // Stands in for code inside the sandbox exchanging a directory and a link
    // while the host writes through that directory.
    const auto real = (sandbox.root / "d").string();
    const auto link = (sandbox.root / "link").string();
    const auto exchange = [&real, &link] {
        return ::renameat2(AT_FDCWD, real.c_str(), AT_FDCWD, link.c_str(), RENAME_EXCHANGE) == 0;
    };
    if (!exchange()) {
        GTEST_SKIP() << "filesystem cannot exchange entries atomically";
    }

    std::atomic<bool> stop{false};
    std::thread swapper([&stop, &exchange] {
        while (!stop && exchange()) {
        }
    });
    for (int i = 0; i < 2000; ++i) {
        try {
            service.WriteFile(sb::MakeWriteRequest("alice", "d/planted.txt", "x"));
        } catch (const SandboxError& ex) {
            EXPECT_EQ(ex.Code(), ErrorCode::kPathEscape);
        }
        try {
            service.RemoveEntry(sb::MakeRemoveRequest("alice", "d/keep.txt", false));
        } catch (const SandboxError& ex) {
            EXPECT_TRUE(ex.Code() == ErrorCode::kPathEscape || ex.Code() == ErrorCode::kPathNotFound);
        }
    }
    stop = true;
    swapper.join();

    EXPECT_FALSE(fs::exists(outside / "planted.txt"));
    EXPECT_EQ(ReadText(outside / "keep.txt"), "keep");
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, missing_sandboxes_leave_no_lock_entries) {
    auto& service = Service();
    for (int i = 0; i < 50; ++i) {
        const auto user = "ghost" + std::to_string(i);
        EXPECT_EQ(CodeOf([&] { service.Run(sb::MakeRunRequest(user, "echo hi")); }), ErrorCode::kNotFound);
        EXPECT_EQ(CodeOf([&] { service.InstallPackages(sb::MakeInstallRequest(user, "requests"), nullptr); }),
                  ErrorCode::kNotFound);
        EXPECT_EQ(CodeOf([&] { service.DeleteSandbox(user); }), ErrorCode::kNotFound);
        EXPECT_EQ(CodeOf([&] { service.ListDirectory(sb::MakeListRequest(user, "", 0)); }), ErrorCode::kNotFound);
        EXPECT_EQ(CodeOf([&] { service.WriteFile(sb::MakeWriteRequest(user, "a", "b")); }), ErrorCode::kNotFound);
        EXPECT_EQ(CodeOf([&] { service.RemoveEntry(sb::MakeRemoveRequest(user, "a", false)); }),
                  ErrorCode::kNotFound);
        EXPECT_EQ(CodeOf([&] { service.Info(user); }), ErrorCode::kNotFound);
    }
    EXPECT_EQ(locks_.Size(), 0u);

    service.Create("alice");
    service.Run(sb::MakeRunRequest("alice", "echo hi"));
    EXPECT_EQ(locks_.Size(), 1u);
    service.DeleteSandbox("alice");
    EXPECT_EQ(locks_.Size(), 0u);
}

// NOLINTNEXTLINE
TEST_F(ServiceFixture, health_reports_engine_and_image) {
    const auto health = Service().HealthCheck();
    EXPECT_TRUE(health.runtime_reachable);
    EXPECT_TRUE(health.image_present);
    EXPECT_NO_THROW(Service().PrepareImage());
}

// NOLINTNEXTLINE
TEST(sandbox_service, options_from_config) {
    ilbox::config::Config config{};
    config.sandbox.retention_s = 60;
    config.limits.timeout_s = 5;
    config.limits.memory = "64m";
    config.runtime.pull_on_startup = false;
    config.install.log_interval_ms = 500;
    config.install.max_log_bytes = 4096;
    config.limits.echo_last_expr = false;
    const auto options = ServiceOptions::FromConfig(config);
    EXPECT_EQ(options.retention, 60s);
    EXPECT_EQ(options.run_timeout, 5s);
    EXPECT_EQ(options.limits.memory, "64m");
    EXPECT_EQ(options.install.limits.memory, "64m");
    EXPECT_TRUE(options.launcher.ensure_image);
    EXPECT_TRUE(options.install.ensure_image);
    EXPECT_EQ(options.log_interval, 500ms);
    EXPECT_EQ(options.install.max_log_bytes, 4096u);
    EXPECT_FALSE(options.launcher.echo_last_expr);
}
