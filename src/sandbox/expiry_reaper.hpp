#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

#include "sandbox/lock_table.hpp"
#include "sandbox/sandbox_registry.hpp"

namespace ilbox::sandbox {

class ExpiryReaper {
public:
    struct SweepStats {
        std::size_t expired = 0;
        std::size_t deleted = 0;
        std::size_t skipped = 0;
        bool ran = false;
    };

    ExpiryReaper(SandboxRegistry& registry,
                 LockTable& locks,
                 std::chrono::seconds retention,
                 std::chrono::seconds interval);
    ~ExpiryReaper();

    void Start();
    void Stop();

    // One sweep. Returns with ran == false if another sweep is in progress.
    SweepStats SweepOnce(std::chrono::system_clock::time_point now);
    SweepStats SweepOnce();

    std::chrono::seconds Retention() const { return retention_; }

private:
    void RunLoop();

    SandboxRegistry& registry_;
    LockTable& locks_;
    std::chrono::seconds retention_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::mutex sweep_mutex_;
};

}  // namespace ilbox::sandbox
