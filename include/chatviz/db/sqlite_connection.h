#pragma once

#include <string>

struct sqlite3;      // Forward declaration for SQLite database handle

namespace chatviz {
namespace db {

/*
 * Low-level RAII wrapper around a SQLite database connection.
 * All public methods forward to the underlying C API while enforcing
 * exception-based error handling and ownership semantics.
 */
class SQLiteConnection {
public:
    // Opens the per-user settings database (~/.chatviz/chatviz.db).
    SQLiteConnection();
    // Opens the database at path; ":memory:" gives a private in-memory database.
    explicit SQLiteConnection(const std::string& path);
    ~SQLiteConnection();

    SQLiteConnection(const SQLiteConnection&) = delete;
    SQLiteConnection& operator=(const SQLiteConnection&) = delete;

    // Execute one or more SQL statements separated by semicolons.
    void exec(const std::string& sql);

    // Return the raw sqlite3* handle (use with care).
    sqlite3* getDbHandle();

    static std::string defaultDatabasePath();

private:
    void open(const std::string& path);

    sqlite3* db = nullptr;
};

} // namespace db
} // namespace chatviz
