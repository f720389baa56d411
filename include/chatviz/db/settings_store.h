#pragma once

#include <chatviz/db/sqlite_connection.h>
#include <optional>
#include <string>

namespace chatviz {
namespace db {

/*
 * Key-value persistence on the `settings` table.
 */
class SettingsStore {
public:
    explicit SettingsStore(SQLiteConnection& db_conn);

    /// Inserts or replaces a setting. Throws std::runtime_error on SQLite failure.
    void saveSetting(const std::string& key, const std::string& value);

    /// Loads a setting's value by its key.
    std::optional<std::string> loadSetting(const std::string& key);

private:
    SQLiteConnection& m_db_conn;
};

} // namespace db
} // namespace chatviz
