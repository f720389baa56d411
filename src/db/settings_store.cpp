#include <chatviz/db/settings_store.h>
#include <sqlite3.h>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace chatviz {
namespace db {
namespace {
struct SQLiteStmtDeleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }
};
using unique_sqlite_stmt_ptr = std::unique_ptr<sqlite3_stmt, SQLiteStmtDeleter>;

std::string lastError(SQLiteConnection& conn) {
    return sqlite3_errmsg(conn.getDbHandle());
}

// Prepares sql and binds key to the first parameter. Null on failure.
unique_sqlite_stmt_ptr prepareKeyed(SQLiteConnection& conn, const char* sql, const std::string& key) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(conn.getDbHandle(), sql, -1, &raw, nullptr) != SQLITE_OK) {
        if (raw) sqlite3_finalize(raw);
        return nullptr;
    }
    unique_sqlite_stmt_ptr stmt(raw);
    if (sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        return nullptr;
    }
    return stmt;
}
} // end anonymous namespace

SettingsStore::SettingsStore(SQLiteConnection& db_conn) : m_db_conn(db_conn) {}

void SettingsStore::saveSetting(const std::string& key, const std::string& value) {
    unique_sqlite_stmt_ptr stmt =
        prepareKeyed(m_db_conn, "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?)", key);
    if (!stmt) {
        throw std::runtime_error("Failed to prepare saveSetting(" + key + "): " + lastError(m_db_conn));
    }
    if (sqlite3_bind_text(stmt.get(), 2, value.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error("Failed to bind value in saveSetting: " + lastError(m_db_conn));
    }
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("saveSetting failed: " + lastError(m_db_conn));
    }
}

std::optional<std::string> SettingsStore::loadSetting(const std::string& key) {
    unique_sqlite_stmt_ptr stmt = prepareKeyed(m_db_conn, "SELECT value FROM settings WHERE key = ?", key);
    if (!stmt) {
        std::cerr << "Warning: loadSetting(" << key << ") prepare failed: " << lastError(m_db_conn) << std::endl;
        return std::nullopt;
    }

    int step_result = sqlite3_step(stmt.get());
    if (step_result == SQLITE_ROW) {
        const unsigned char* text = sqlite3_column_text(stmt.get(), 0);
        if (text) {
            return std::string(reinterpret_cast<const char*>(text));
        }
    } else if (step_result != SQLITE_DONE) {
        std::cerr << "Warning: loadSetting(" << key << ") failed: " << lastError(m_db_conn) << std::endl;
    }
    return std::nullopt;
}

} // namespace db
} // namespace chatviz
