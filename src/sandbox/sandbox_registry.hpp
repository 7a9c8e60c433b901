#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/sandbox_types.hpp"
#include "sqlite3.h"

namespace ilbox::sandbox {

// Owns the set of sandbox records. Metadata lives in <base>/registry.db, which
// is outside every sandbox root; each mutation is committed before returning.
class SandboxRegistry {
public:
    explicit SandboxRegistry(std::filesystem::path base_dir);
    ~SandboxRegistry();

    SandboxRegistry(const SandboxRegistry&) = delete;
    SandboxRegistry& operator=(const SandboxRegistry&) = delete;

    Sandbox Create(const std::string& user_id);
    Sandbox Get(const std::string& user_id) const;
    std::optional<Sandbox> Find(const std::string& user_id) const;
    void Touch(const std::string& user_id);
    void Touch(const std::string& user_id, std::chrono::system_clock::time_point at);
    void Delete(const std::string& user_id);
    std::vector<std::string> ListExpired(std::chrono::system_clock::time_point now,
                                         std::chrono::seconds retention) const;
    std::vector<Sandbox> List() const;

    // Drops records whose root is gone and removes directories without a record.
    void Reconcile();

    static std::uintmax_t MeasureSize(const Sandbox& sandbox);
    static bool IsExpired(const Sandbox& sandbox,
                          std::chrono::system_clock::time_point now,
                          std::chrono::seconds retention);

    const std::filesystem::path& BaseDir() const { return base_dir_; }

private:
    void EnsureSchema();
    std::optional<Sandbox> Load(const std::string& user_id) const;
    void Exec(const std::string& sql) const;
    static std::string SafeText(const unsigned char* text);

    std::filesystem::path base_dir_;
    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

}  // namespace ilbox::sandbox
