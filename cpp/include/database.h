#ifndef PROMPTVAULT_DATABASE_H
#define PROMPTVAULT_DATABASE_H

#include <string>
#include <optional>
#include <cstdint>
#include <sqlite3.h>

namespace promptvault {

struct DatabaseOptions {
    int busy_timeout_ms = 5000;
    std::string journal_mode = "WAL";
};

// Owns the SQLite connection for the prompt library.
// Opening creates the file and any missing parent directories.
// Every SQLite failure is raised as StorageError.
class Database {
public:
    explicit Database(const std::string& path, const DatabaseOptions& options = DatabaseOptions());
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Create tables and indexes if absent. Safe to call repeatedly.
    void ensureSchema();

    // Run one or more statements without results
    void exec(const std::string& sql);

    int64_t lastInsertId() const;
    int changes() const;
    bool inTransaction() const;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }
    std::string lastError() const;

private:
    void configure(const DatabaseOptions& options);

    sqlite3* db_;
    std::string path_;
};

// Prepared statement, finalized on destruction
class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameter indexes are 1-based, as in SQLite
    Statement& bindText(int index, const std::string& value);
    Statement& bindInt64(int index, int64_t value);
    Statement& bindDouble(int index, double value);
    Statement& bindNull(int index);
    Statement& bindOptionalInt(int index, const std::optional<int>& value);

    // Advance; true while a row is available
    bool step();

    // Step a statement that must not return rows
    void run();

    void reset();

    // Column indexes are 0-based; NULL reads as "" / 0
    std::string columnText(int col) const;
    int64_t columnInt64(int col) const;
    double columnDouble(int col) const;
    bool columnIsNull(int col) const;

private:
    void check(int rc, const char* action);

    Database& db_;
    sqlite3_stmt* stmt_;
    std::string sql_;
};

// BEGIN IMMEDIATE on construction; rolls back on destruction unless committed
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_;
};

} // namespace promptvault

#endif // PROMPTVAULT_DATABASE_H
