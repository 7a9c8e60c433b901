#include "sandbox/log_throttler.hpp"

namespace ilbox::sandbox {

LogThrottler::LogThrottler(std::chrono::milliseconds interval)
    : interval_(interval) {}

bool LogThrottler::ShouldEmit(const InstallJob& job, std::chrono::steady_clock::time_point now) const {
    if (job.terminal) {
        return true;
    }
    const auto since = job.last_emit_at.value_or(job.started_at);
    return now - since >= interval_;
}

void LogThrottler::Record(InstallJob& job, std::chrono::steady_clock::time_point now) const {
    job.last_emit_at = now;
}

}  // namespace ilbox::sandbox
