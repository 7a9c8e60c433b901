#include "sandbox/expiry_reaper.hpp"

#include <string>

#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace ilbox::sandbox {

ExpiryReaper::ExpiryReaper(SandboxRegistry& registry,
                           LockTable& locks,
                           std::chrono::seconds retention,
                           std::chrono::seconds interval)
    : registry_(registry)
    , locks_(locks)
    , retention_(retention)
    , interval_(interval) {}

ExpiryReaper::~ExpiryReaper() {
    Stop();
}

void ExpiryReaper::Start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { RunLoop(); });
    utils::LogInfo("reaper", "started retention=" + std::to_string(retention_.count()) +
                   "s interval=" + std::to_string(interval_.count()) + "s");
}

void ExpiryReaper::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ExpiryReaper::RunLoop() {
    while (running_) {
        SweepOnce();
        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

ExpiryReaper::SweepStats ExpiryReaper::SweepOnce() {
    return SweepOnce(utils::Now());
}

ExpiryReaper::SweepStats ExpiryReaper::SweepOnce(std::chrono::system_clock::time_point now) {
    SweepStats stats{};
    std::unique_lock<std::mutex> sweep(sweep_mutex_, std::try_to_lock);
    if (!sweep.owns_lock()) {
        return stats;
    }
    stats.ran = true;

    std::vector<std::string> expired;
    try {
        expired = registry_.ListExpired(now, retention_);
    } catch (const SandboxError& ex) {
        utils::LogError("reaper", std::string("listing expired sandboxes failed: ") + ex.what());
        return stats;
    }
    stats.expired = expired.size();

    for (const auto& user_id : expired) {
        try {
            auto guard = locks_.AcquireExecution(user_id);
            auto files = guard.LockFiles();
            // Activity may have happened between listing and locking.
            const auto sandbox = registry_.Find(user_id);
            if (!sandbox.has_value()) {
                locks_.Erase(user_id);
                ++stats.skipped;
                continue;
            }
            if (!SandboxRegistry::IsExpired(*sandbox, now, retention_)) {
                ++stats.skipped;
                continue;
            }
            const auto size = SandboxRegistry::MeasureSize(*sandbox);
            registry_.Delete(user_id);
            locks_.Erase(user_id);
            ++stats.deleted;
            utils::LogInfo("reaper", "deleted expired sandbox user=" + user_id +
                           " size=" + std::to_string(size) + "B");
        } catch (const SandboxError& ex) {
            ++stats.skipped;
            utils::LogWarn("reaper", "skipping user=" + user_id + " until next sweep: " + ex.what());
        }
    }
    return stats;
}

}  // namespace ilbox::sandbox
