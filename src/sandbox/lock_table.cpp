#include "sandbox/lock_table.hpp"

#include "sandbox/sandbox_error.hpp"

namespace ilbox::sandbox {

LockTable::ExclusiveGuard::ExclusiveGuard(std::shared_ptr<Entry> entry, std::unique_lock<std::mutex> lock)
    : entry_(std::move(entry))
    , lock_(std::move(lock)) {}

std::unique_lock<std::shared_mutex> LockTable::ExclusiveGuard::LockFiles() {
    return std::unique_lock<std::shared_mutex>(entry_->files);
}

LockTable::SharedGuard::SharedGuard(std::shared_ptr<Entry> entry, std::shared_lock<std::shared_mutex> lock)
    : entry_(std::move(entry))
    , lock_(std::move(lock)) {}

std::shared_ptr<LockTable::Entry> LockTable::GetOrCreate(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[user_id];
    if (!entry) {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

bool LockTable::IsCurrent(const std::string& user_id, const std::shared_ptr<Entry>& entry) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(user_id);
    return it != entries_.end() && it->second == entry;
}

LockTable::ExclusiveGuard LockTable::AcquireExecution(const std::string& user_id) {
    while (true) {
        auto entry = GetOrCreate(user_id);
        std::unique_lock<std::mutex> lock(entry->execution, std::try_to_lock);
        if (!lock.owns_lock()) {
            throw SandboxError(ErrorCode::kSandboxBusy,
                               "another run or install is already in progress for this sandbox");
        }
        // The entry may have been erased by a delete between lookup and lock.
        if (IsCurrent(user_id, entry)) {
            return ExclusiveGuard(std::move(entry), std::move(lock));
        }
    }
}

LockTable::SharedGuard LockTable::AcquireFiles(const std::string& user_id) {
    while (true) {
        auto entry = GetOrCreate(user_id);
        std::shared_lock<std::shared_mutex> lock(entry->files);
        if (IsCurrent(user_id, entry)) {
            return SharedGuard(std::move(entry), std::move(lock));
        }
    }
}

void LockTable::Erase(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(user_id);
}

std::size_t LockTable::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace ilbox::sandbox
