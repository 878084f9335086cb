#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "i_paste_store.hpp"

namespace pastebin {
namespace store {

/**
 * @brief File-backed paste table on SQLite
 *
 * Owns a single connection, opened by open() and closed by close() or the
 * destructor. The schema is created on open if absent. Calls are serialized
 * on an internal mutex so the store can be shared by HTTP worker threads.
 *
 * Table: pastes(id TEXT PRIMARY KEY, content TEXT NOT NULL,
 *               created_at DATETIME DEFAULT CURRENT_TIMESTAMP)
 */
class SqlitePasteStore : public IPasteStore {
public:
    // Opens (creating if needed) the database file. Throws std::runtime_error on failure.
    [[nodiscard]] static std::unique_ptr<SqlitePasteStore> open(const std::filesystem::path &database_file);

    ~SqlitePasteStore() override;

    SqlitePasteStore(const SqlitePasteStore &) = delete;
    SqlitePasteStore &operator=(const SqlitePasteStore &) = delete;

    StoreStatus insert(const std::string &id, const std::string &content, std::string &error) override;
    StoreStatus get_by_id(const std::string &id, paste::PasteRecord &record, std::string &error) override;

    // Closes the connection. Later calls fail with StoreStatus::ERROR. Safe to call multiple times.
    void close();

    bool is_open() const;


private:
    explicit SqlitePasteStore(const std::filesystem::path &database_file);

    void exec_sql(const char *sql);

    const std::filesystem::path database_file_;
    struct Impl;
    std::unique_ptr<Impl> impl_;
    mutable std::mutex mutex_;
};

}  // namespace store
}  // namespace pastebin
