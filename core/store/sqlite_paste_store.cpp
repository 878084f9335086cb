#include "sqlite_paste_store.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "logging/logger.hpp"

namespace fs = std::filesystem;

namespace pastebin {
namespace store {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char *kSchema =
    "CREATE TABLE IF NOT EXISTS pastes ("
    "  id TEXT PRIMARY KEY,"
    "  content TEXT NOT NULL,"
    "  created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
    ");";

constexpr const char *kInsertPaste = "INSERT INTO pastes (id, content) VALUES (?1, ?2);";
constexpr const char *kSelectPaste = "SELECT id, content, created_at FROM pastes WHERE id = ?1;";

struct StatementDeleter {
    void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

std::string column_string(sqlite3_stmt *stmt, int col) {
    const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
    if (text == nullptr) {
        return {};
    }
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

bool bind_string(sqlite3_stmt *stmt, int index, const std::string &value) {
    return sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) ==
           SQLITE_OK;
}

}  // namespace

const char *store_status_to_string(StoreStatus status) {
    switch (status) {
        case StoreStatus::OK:
            return "OK";
        case StoreStatus::NOT_FOUND:
            return "NOT_FOUND";
        case StoreStatus::CONSTRAINT_VIOLATION:
            return "CONSTRAINT_VIOLATION";
        case StoreStatus::ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

struct SqlitePasteStore::Impl {
    sqlite3 *db = nullptr;

    explicit Impl(sqlite3 *handle) : db(handle) {}

    ~Impl() {
        if (db != nullptr) {
            sqlite3_close(db);
        }
        db = nullptr;
    }
};

std::unique_ptr<SqlitePasteStore> SqlitePasteStore::open(const fs::path &database_file) {
    return std::unique_ptr<SqlitePasteStore>(new SqlitePasteStore(database_file));
}

SqlitePasteStore::SqlitePasteStore(const fs::path &database_file) : database_file_(database_file) {
    if (!database_file_.parent_path().empty()) {
        fs::create_directories(database_file_.parent_path());
    }

    sqlite3 *handle = nullptr;
    if (sqlite3_open(database_file_.string().c_str(), &handle) != SQLITE_OK || handle == nullptr) {
        std::string msg = "SQLite open failed for " + database_file_.string();
        if (handle != nullptr) {
            msg += std::string(": ") + sqlite3_errmsg(handle);
            sqlite3_close(handle);
        }
        throw std::runtime_error(msg);
    }
    impl_ = std::make_unique<Impl>(handle);

    sqlite3_busy_timeout(impl_->db, kBusyTimeoutMs);
    exec_sql("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;");
    exec_sql(kSchema);

    LOG_INFO("[Store] Opened " << database_file_.string());
}

SqlitePasteStore::~SqlitePasteStore() { close(); }

void SqlitePasteStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (impl_) {
        impl_.reset();
        LOG_INFO("[Store] Closed " << database_file_.string());
    }
}

bool SqlitePasteStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return impl_ != nullptr;
}

void SqlitePasteStore::exec_sql(const char *sql) {
    char *err = nullptr;
    if (sqlite3_exec(impl_->db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err != nullptr ? err : "unknown sql error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

StoreStatus SqlitePasteStore::insert(const std::string &id, const std::string &content, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!impl_) {
        error = "store is closed";
        return StoreStatus::ERROR;
    }

    sqlite3_stmt *raw = nullptr;
    if (sqlite3_prepare_v2(impl_->db, kInsertPaste, -1, &raw, nullptr) != SQLITE_OK) {
        error = std::string("prepare insert failed: ") + sqlite3_errmsg(impl_->db);
        return StoreStatus::ERROR;
    }
    Statement stmt(raw);

    if (!bind_string(stmt.get(), 1, id) || !bind_string(stmt.get(), 2, content)) {
        error = std::string("bind insert failed: ") + sqlite3_errmsg(impl_->db);
        return StoreStatus::ERROR;
    }

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        LOG_DEBUG("[Store] Inserted paste " << id << " (" << content.size() << " bytes)");
        return StoreStatus::OK;
    }

    error = std::string("insert failed: ") + sqlite3_errmsg(impl_->db);
    const int extended = sqlite3_extended_errcode(impl_->db);
    if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return StoreStatus::CONSTRAINT_VIOLATION;
    }
    return StoreStatus::ERROR;
}

StoreStatus SqlitePasteStore::get_by_id(const std::string &id, paste::PasteRecord &record, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!impl_) {
        error = "store is closed";
        return StoreStatus::ERROR;
    }

    sqlite3_stmt *raw = nullptr;
    if (sqlite3_prepare_v2(impl_->db, kSelectPaste, -1, &raw, nullptr) != SQLITE_OK) {
        error = std::string("prepare select failed: ") + sqlite3_errmsg(impl_->db);
        return StoreStatus::ERROR;
    }
    Statement stmt(raw);

    if (!bind_string(stmt.get(), 1, id)) {
        error = std::string("bind select failed: ") + sqlite3_errmsg(impl_->db);
        return StoreStatus::ERROR;
    }

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        error = "no paste with id " + id;
        return StoreStatus::NOT_FOUND;
    }
    if (rc != SQLITE_ROW) {
        error = std::string("select failed: ") + sqlite3_errmsg(impl_->db);
        return StoreStatus::ERROR;
    }

    record.id = column_string(stmt.get(), 0);
    record.content = column_string(stmt.get(), 1);
    record.created_at = column_string(stmt.get(), 2);
    return StoreStatus::OK;
}

}  // namespace store
}  // namespace pastebin
