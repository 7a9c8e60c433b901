#pragma once

#include <chrono>

#include "sandbox/sandbox_types.hpp"

namespace ilbox::sandbox {

// Minimum-interval debounce for forwarding install logs. Updates inside the
// interval are dropped; terminal updates always pass.
class LogThrottler {
public:
    explicit LogThrottler(std::chrono::milliseconds interval = std::chrono::milliseconds(3000));

    bool ShouldEmit(const InstallJob& job, std::chrono::steady_clock::time_point now) const;
    void Record(InstallJob& job, std::chrono::steady_clock::time_point now) const;

    std::chrono::milliseconds Interval() const { return interval_; }

private:
    std::chrono::milliseconds interval_;
};

}  // namespace ilbox::sandbox
