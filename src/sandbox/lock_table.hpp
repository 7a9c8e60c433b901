#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ilbox::sandbox {

// Per-user locks. The execution lock serializes run/install/delete and is only
// ever try-locked; the filesystem lock is shared by file operations and taken
// exclusively by delete.
class LockTable {
public:
    struct Entry {
        std::mutex execution;
        std::shared_mutex files;
    };

    class ExclusiveGuard {
    public:
        ExclusiveGuard(std::shared_ptr<Entry> entry, std::unique_lock<std::mutex> lock);
        ExclusiveGuard(ExclusiveGuard&&) = default;
        ExclusiveGuard& operator=(ExclusiveGuard&&) = delete;

        bool OwnsLock() const { return lock_.owns_lock(); }

        // Takes the same user's filesystem lock exclusively (used by delete).
        std::unique_lock<std::shared_mutex> LockFiles();

    private:
        std::shared_ptr<Entry> entry_;
        std::unique_lock<std::mutex> lock_;
    };

    class SharedGuard {
    public:
        SharedGuard(std::shared_ptr<Entry> entry, std::shared_lock<std::shared_mutex> lock);
        SharedGuard(SharedGuard&&) = default;
        SharedGuard& operator=(SharedGuard&&) = delete;

        void Unlock() { lock_.unlock(); }

    private:
        std::shared_ptr<Entry> entry_;
        std::shared_lock<std::shared_mutex> lock_;
    };

    // Throws SandboxError(kSandboxBusy) when another execution-class
    // operation holds the user's lock.
    ExclusiveGuard AcquireExecution(const std::string& user_id);

    // Blocks while a delete for the same user is in progress.
    SharedGuard AcquireFiles(const std::string& user_id);

    void Erase(const std::string& user_id);
    std::size_t Size() const;

private:
    std::shared_ptr<Entry> GetOrCreate(const std::string& user_id);
    bool IsCurrent(const std::string& user_id, const std::shared_ptr<Entry>& entry) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace ilbox::sandbox
