#include "database.h"
#include "errors.h"
#include "utils.h"

namespace promptvault {

namespace {

const char* SCHEMA_SQL = R"(
    CREATE TABLE IF NOT EXISTS prompts (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        title TEXT NOT NULL,
        content TEXT NOT NULL,
        tags TEXT NOT NULL DEFAULT '[]',
        is_favorite INTEGER NOT NULL DEFAULT 0,
        score_avg REAL NOT NULL DEFAULT 0,
        score_count INTEGER NOT NULL DEFAULT 0,
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS prompt_versions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        prompt_id INTEGER NOT NULL,
        content TEXT NOT NULL,
        change_note TEXT NOT NULL DEFAULT '',
        created_at TEXT NOT NULL,
        FOREIGN KEY (prompt_id) REFERENCES prompts(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS usage_logs (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        prompt_id INTEGER NOT NULL,
        input_vars TEXT NOT NULL DEFAULT '{}',
        output_text TEXT NOT NULL,
        rating INTEGER,
        used_at TEXT NOT NULL,
        FOREIGN KEY (prompt_id) REFERENCES prompts(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_prompts_updated_at ON prompts(updated_at);
    CREATE INDEX IF NOT EXISTS idx_prompt_versions_prompt_id ON prompt_versions(prompt_id);
    CREATE INDEX IF NOT EXISTS idx_usage_logs_prompt_id ON usage_logs(prompt_id);
)";

} // namespace

// ============================================================================
// Database
// ============================================================================

Database::Database(const std::string& path, const DatabaseOptions& options)
    : db_(nullptr)
    , path_(path)
{
    if (path_ != ":memory:") {
        std::string dir = utils::getDirname(path_);
        if (!utils::dirExists(dir) && !utils::createDirs(dir)) {
            throw StorageError("Failed to create database directory: " + dir);
        }
    }

    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        utils::log::error("Cannot open prompt database " + path_ + ": " + msg);
        throw StorageError("Cannot open prompt database " + path_ + ": " + msg, rc);
    }

    try {
        configure(options);
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    utils::log::debug("Opened prompt database " + path_);
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::configure(const DatabaseOptions& options) {
    // Cascade deletes depend on this; it is per-connection in SQLite
    exec("PRAGMA foreign_keys = ON;");

    int rc = sqlite3_busy_timeout(db_, options.busy_timeout_ms);
    if (rc != SQLITE_OK) {
        throw StorageError("Failed to set busy timeout: " + lastError(), rc);
    }

    if (path_ != ":memory:" && !options.journal_mode.empty()) {
        exec("PRAGMA journal_mode = " + options.journal_mode + ";");
    }
}

void Database::ensureSchema() {
    exec(SCHEMA_SQL);
    utils::log::info("Prompt database schema ready at " + path_);
}

void Database::exec(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string msg = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        utils::log::error("SQL error: " + msg);
        throw StorageError("SQL error: " + msg, rc);
    }
}

int64_t Database::lastInsertId() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

bool Database::inTransaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

std::string Database::lastError() const {
    return db_ ? sqlite3_errmsg(db_) : "database is not open";
}

// ============================================================================
// Statement
// ============================================================================

Statement::Statement(Database& db, const std::string& sql)
    : db_(db)
    , stmt_(nullptr)
    , sql_(sql)
{
    int rc = sqlite3_prepare_v2(db_.handle(), sql_.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_.lastError();
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        utils::log::error("Failed to prepare statement: " + msg);
        throw StorageError("Failed to prepare statement: " + msg, rc);
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

void Statement::check(int rc, const char* action) {
    if (rc != SQLITE_OK) {
        std::string msg = std::string("Failed to ") + action + ": " + db_.lastError();
        utils::log::error(msg);
        throw StorageError(msg, rc);
    }
}

Statement& Statement::bindText(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT), "bind text");
    return *this;
}

Statement& Statement::bindInt64(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value), "bind integer");
    return *this;
}

Statement& Statement::bindDouble(int index, double value) {
    check(sqlite3_bind_double(stmt_, index, value), "bind real");
    return *this;
}

Statement& Statement::bindNull(int index) {
    check(sqlite3_bind_null(stmt_, index), "bind null");
    return *this;
}

Statement& Statement::bindOptionalInt(int index, const std::optional<int>& value) {
    if (value) {
        return bindInt64(index, *value);
    }
    return bindNull(index);
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;

    std::string msg = "Failed to execute statement: " + db_.lastError();
    utils::log::error(msg);
    throw StorageError(msg, rc);
}

void Statement::run() {
    if (step()) {
        throw StorageError("Statement unexpectedly returned rows: " + sql_);
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

std::string Statement::columnText(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    if (!text) return "";
    int bytes = sqlite3_column_bytes(stmt_, col);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes));
}

int64_t Statement::columnInt64(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

double Statement::columnDouble(int col) const {
    return sqlite3_column_double(stmt_, col);
}

bool Statement::columnIsNull(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

// ============================================================================
// Transaction
// ============================================================================

Transaction::Transaction(Database& db)
    : db_(db)
    , done_(false)
{
    db_.exec("BEGIN IMMEDIATE TRANSACTION;");
}

Transaction::~Transaction() {
    if (done_) return;

    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_.handle(), "ROLLBACK TRANSACTION;", nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        utils::log::error(std::string("Rollback failed: ") + (errmsg ? errmsg : sqlite3_errstr(rc)));
    } else {
        utils::log::debug("Transaction rolled back");
    }
    sqlite3_free(errmsg);
}

void Transaction::commit() {
    db_.exec("COMMIT TRANSACTION;");
    done_ = true;
}

} // namespace promptvault
