#include "sandbox/sandbox_registry.hpp"

#include <algorithm>
#include <set>
#include <system_error>

#include "sandbox/requests.hpp"
#include "sandbox/sandbox_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace ilbox::sandbox {
namespace fs = std::filesystem;
namespace {

constexpr const char* kRegistryFile = "registry.db";

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            const std::string message = sqlite3_errmsg(db);
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
            throw SandboxError(ErrorCode::kStorage, "sqlite prepare failed: " + message);
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void BindText(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void BindInt64(int index, long long value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    // Returns true while rows are available.
    bool Step() {
        const auto rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw SandboxError(ErrorCode::kStorage, std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
        }
        return false;
    }

    sqlite3_stmt* Get() const { return stmt_; }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace

SandboxRegistry::SandboxRegistry(fs::path base_dir)
    : base_dir_(std::move(base_dir))
    , db_path_(base_dir_ / kRegistryFile) {
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        throw SandboxError(ErrorCode::kStorage, "cannot create base directory " + base_dir_.string() + ": " + ec.message());
    }
    base_dir_ = fs::canonical(base_dir_);
    db_path_ = base_dir_ / kRegistryFile;
    EnsureSchema();
}

SandboxRegistry::~SandboxRegistry() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SandboxRegistry::EnsureSchema() {
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        const std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw SandboxError(ErrorCode::kStorage, "failed to open sqlite db " + db_path_.string() + ": " + message);
    }
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=FULL;");
    Exec("CREATE TABLE IF NOT EXISTS sandboxes ("
         "user_id TEXT PRIMARY KEY,"
         "root TEXT NOT NULL,"
         "created_at_ms INTEGER NOT NULL,"
         "last_used_ms INTEGER NOT NULL"
         ");");
}

void SandboxRegistry::Exec(const std::string& sql) const {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw SandboxError(ErrorCode::kStorage, "sqlite exec error: " + message);
    }
}

std::string SandboxRegistry::SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::optional<Sandbox> SandboxRegistry::Load(const std::string& user_id) const {
    Statement stmt(db_, "SELECT root, created_at_ms, last_used_ms FROM sandboxes WHERE user_id = ?;");
    stmt.BindText(1, user_id);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    Sandbox sandbox{};
    sandbox.user_id = user_id;
    sandbox.root = SafeText(sqlite3_column_text(stmt.Get(), 0));
    sandbox.created_at = utils::FromMs(sqlite3_column_int64(stmt.Get(), 1));
    sandbox.last_used_at = utils::FromMs(sqlite3_column_int64(stmt.Get(), 2));
    return sandbox;
}

Sandbox SandboxRegistry::Create(const std::string& user_id) {
    // The id names a directory under the base.
    RequireValidUserId(user_id);
    std::lock_guard<std::mutex> lock(mutex_);
    if (Load(user_id).has_value()) {
        throw SandboxError(ErrorCode::kAlreadyExists, "a sandbox already exists for user " + user_id);
    }

    const auto root = base_dir_ / user_id;
    std::error_code ec;
    if (fs::exists(root, ec)) {
        utils::LogWarn("registry", "removing unregistered directory " + root.string());
        fs::remove_all(root, ec);
        if (ec) {
            throw SandboxError(ErrorCode::kStorage, "cannot clear stale directory " + root.string() + ": " + ec.message());
        }
    }
    fs::create_directories(root / kPackagesDir, ec);
    if (ec) {
        throw SandboxError(ErrorCode::kStorage, "cannot create sandbox root " + root.string() + ": " + ec.message());
    }

    Sandbox sandbox{};
    sandbox.user_id = user_id;
    sandbox.root = root;
    // Stored with millisecond precision; return what a later Get would.
    sandbox.created_at = utils::FromMs(utils::ToMs(utils::Now()));
    sandbox.last_used_at = sandbox.created_at;
    try {
        Statement stmt(db_, "INSERT INTO sandboxes(user_id, root, created_at_ms, last_used_ms) VALUES(?, ?, ?, ?);");
        stmt.BindText(1, user_id);
        stmt.BindText(2, root.string());
        stmt.BindInt64(3, utils::ToMs(sandbox.created_at));
        stmt.BindInt64(4, utils::ToMs(sandbox.last_used_at));
        stmt.Step();
    } catch (const SandboxError&) {
        fs::remove_all(root, ec);
        throw;
    }
    utils::LogInfo("registry", "created sandbox user=" + user_id + " root=" + root.string());
    return sandbox;
}

Sandbox SandboxRegistry::Get(const std::string& user_id) const {
    auto sandbox = Find(user_id);
    if (!sandbox.has_value()) {
        throw SandboxError(ErrorCode::kNotFound, "no sandbox for user " + user_id);
    }
    return *sandbox;
}

std::optional<Sandbox> SandboxRegistry::Find(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Load(user_id);
}

void SandboxRegistry::Touch(const std::string& user_id) {
    Touch(user_id, utils::Now());
}

void SandboxRegistry::Touch(const std::string& user_id, std::chrono::system_clock::time_point at) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_, "UPDATE sandboxes SET last_used_ms = MAX(last_used_ms, ?) WHERE user_id = ?;");
    stmt.BindInt64(1, utils::ToMs(at));
    stmt.BindText(2, user_id);
    stmt.Step();
    if (sqlite3_changes(db_) == 0) {
        throw SandboxError(ErrorCode::kNotFound, "no sandbox for user " + user_id);
    }
}

void SandboxRegistry::Delete(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto sandbox = Load(user_id);
    if (!sandbox.has_value()) {
        throw SandboxError(ErrorCode::kNotFound, "no sandbox for user " + user_id);
    }
    std::error_code ec;
    fs::remove_all(sandbox->root, ec);
    if (ec) {
        throw SandboxError(ErrorCode::kStorage, "cannot remove " + sandbox->root.string() + ": " + ec.message());
    }
    Statement stmt(db_, "DELETE FROM sandboxes WHERE user_id = ?;");
    stmt.BindText(1, user_id);
    stmt.Step();
    utils::LogInfo("registry", "deleted sandbox user=" + user_id);
}

std::vector<std::string> SandboxRegistry::ListExpired(std::chrono::system_clock::time_point now,
                                                      std::chrono::seconds retention) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> expired;
    Statement stmt(db_, "SELECT user_id FROM sandboxes WHERE last_used_ms + ? <= ? ORDER BY last_used_ms ASC;");
    stmt.BindInt64(1, std::chrono::duration_cast<std::chrono::milliseconds>(retention).count());
    stmt.BindInt64(2, utils::ToMs(now));
    while (stmt.Step()) {
        expired.push_back(SafeText(sqlite3_column_text(stmt.Get(), 0)));
    }
    return expired;
}

std::vector<Sandbox> SandboxRegistry::List() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Sandbox> sandboxes;
    Statement stmt(db_, "SELECT user_id, root, created_at_ms, last_used_ms FROM sandboxes ORDER BY user_id;");
    while (stmt.Step()) {
        Sandbox sandbox{};
        sandbox.user_id = SafeText(sqlite3_column_text(stmt.Get(), 0));
        sandbox.root = SafeText(sqlite3_column_text(stmt.Get(), 1));
        sandbox.created_at = utils::FromMs(sqlite3_column_int64(stmt.Get(), 2));
        sandbox.last_used_at = utils::FromMs(sqlite3_column_int64(stmt.Get(), 3));
        sandboxes.push_back(std::move(sandbox));
    }
    return sandboxes;
}

void SandboxRegistry::Reconcile() {
    const auto records = List();
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> known;
    for (const auto& sandbox : records) {
        std::error_code ec;
        if (!fs::is_directory(sandbox.root, ec)) {
            utils::LogWarn("registry", "dropping record without root user=" + sandbox.user_id);
            Statement stmt(db_, "DELETE FROM sandboxes WHERE user_id = ?;");
            stmt.BindText(1, sandbox.user_id);
            stmt.Step();
            continue;
        }
        known.insert(sandbox.root.filename().string());
    }

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(base_dir_, ec)) {
        if (!entry.is_directory(ec) || entry.is_symlink(ec)) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (known.count(name) > 0) {
            continue;
        }
        utils::LogWarn("registry", "removing directory without record " + entry.path().string());
        std::error_code remove_ec;
        fs::remove_all(entry.path(), remove_ec);
        if (remove_ec) {
            utils::LogError("registry", "cannot remove " + entry.path().string() + ": " + remove_ec.message());
        }
    }
}

std::uintmax_t SandboxRegistry::MeasureSize(const Sandbox& sandbox) {
    std::uintmax_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(sandbox.root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec)) {
            const auto size = it->file_size(entry_ec);
            if (!entry_ec) {
                total += size;
            }
        }
    }
    return total;
}

bool SandboxRegistry::IsExpired(const Sandbox& sandbox,
                                std::chrono::system_clock::time_point now,
                                std::chrono::seconds retention) {
    return now >= sandbox.last_used_at + retention;
}

}  // namespace ilbox::sandbox
