#include "sqlconnection.hpp"
#include "log.hpp"
#include <sqlite3.h>

namespace {

const logging::Logger& sql_log() {
    static const logging::Logger log { logging::SQL_LOGGER };
    return log;
}

std::string db_error(sqlite3* db) {
    const char* msg = db ? sqlite3_errmsg(db) : nullptr;
    return msg ? msg : "unknown";
}

} // anonymous namespace

class SQLiteStatement final : public SQLStatement {
public:
    SQLiteStatement(sqlite3_stmt* stmt, std::string sql)
        : stmt_(stmt) { sql_ = std::move(sql); }
    ~SQLiteStatement() override {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    void bind_text(int idx, const std::string& value) override {
        check(sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
    }

    void bind_int(int idx, int64_t value) override {
        check(sqlite3_bind_int64(stmt_, idx, value));
    }

    void bind_null(int idx) override {
        check(sqlite3_bind_null(stmt_, idx));
    }

    bool step() override {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw SqlError(where(__FILE__, __LINE__, "SQLite step failed: " + db_error(sqlite3_db_handle(stmt_))), sql_);
    }

    int column_count() override {
        return sqlite3_column_count(stmt_);
    }

    SqlValue column(int idx) override {
        if (sqlite3_column_type(stmt_, idx) == SQLITE_NULL) return std::nullopt;
        const unsigned char* txt = sqlite3_column_text(stmt_, idx);
        int len = sqlite3_column_bytes(stmt_, idx);
        return std::string(reinterpret_cast<const char*>(txt), static_cast<size_t>(len));
    }

    int exec() override {
        while (step()) { }
        return sqlite3_changes(sqlite3_db_handle(stmt_));
    }

    void reset() override {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw SqlError(where(__FILE__, __LINE__, "SQLite bind failed: " + db_error(sqlite3_db_handle(stmt_))), sql_);
        }
    }

    sqlite3_stmt* stmt_;
};

class SQLiteConnection final : public SQLConnection {
public:
    explicit SQLiteConnection(int busy_timeout_ms)
        : busy_timeout_ms_(busy_timeout_ms) { }
    ~SQLiteConnection() override { disconnect(); }

    void connect(const std::string& dsn) override {
        disconnect();
        if (sqlite3_open(dsn.c_str(), &db_) != SQLITE_OK) {
            std::string err = db_error(db_);
            sqlite3_close(db_);
            db_ = nullptr;
            THROW("Failed to open SQLite DB '%s': %s", dsn.c_str(), err.c_str());
        }
        dsn_ = dsn;
        // foreign_keys stays off (SQLite default) so table rebuilds never cascade into child rows
        sqlite3_busy_timeout(db_, busy_timeout_ms_);
    }

    void disconnect() override {
        if (db_) {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
        tr_started_ = false;
    }

    bool is_open() const override { return db_ != nullptr; }

    // IMMEDIATE takes the write lock up front so concurrent writers queue on busy_timeout
    bool begin() override {
        if (tr_started_) return true;
        execSQL("BEGIN IMMEDIATE;");
        tr_started_ = true;
        return true;
    }

    bool commit() override {
        if (!tr_started_) return false;
        execSQL("COMMIT;");
        tr_started_ = false;
        return true;
    }

    void rollback() override {
        if (!tr_started_) return;
        tr_started_ = false;
        // a failed statement may already have ended the transaction
        if (sqlite3_get_autocommit(db_)) return;
        execSQL("ROLLBACK;");
    }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        require_open();
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()) + 1, &stmt, nullptr) != SQLITE_OK) {
            throw SqlError(where(__FILE__, __LINE__, "SQLite prepare failed: " + db_error(db_)), sql);
        }
        return std::make_unique<SQLiteStatement>(stmt, sql);
    }

    int execute(const std::string& sql) override {
        sql_log().debug("{}", sql);
        execSQL(sql.c_str());
        return sqlite3_changes(db_);
    }

    void export_to(const std::string& path) override {
        require_open();
        sqlite3* dest = nullptr;
        if (sqlite3_open(path.c_str(), &dest) != SQLITE_OK) {
            std::string err = db_error(dest);
            sqlite3_close(dest);
            THROW("cannot open backup target '%s': %s", path.c_str(), err.c_str());
        }
        Finally close_dest([&]() { sqlite3_close(dest); });
        copy_database(db_, dest, path);
    }

    void import_from(const std::string& path) override {
        require_open();
        if (tr_started_) THROW("import_from() inside a transaction");
        sqlite3* src = nullptr;
        if (sqlite3_open_v2(path.c_str(), &src, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            std::string err = db_error(src);
            sqlite3_close(src);
            THROW("cannot open backup source '%s': %s", path.c_str(), err.c_str());
        }
        Finally close_src([&]() { sqlite3_close(src); });
        copy_database(src, db_, path);
    }

private:
    void require_open() const {
        if (!db_) THROW("SQLite connection is not open");
    }

    void execSQL(const char* sql) {
        require_open();
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::string err = errmsg ? errmsg : db_error(db_);
            sqlite3_free(errmsg);
            throw SqlError(where(__FILE__, __LINE__, "SQLite error: " + err), sql);
        }
    }

    // online backup API, copies every page of "main"
    static void copy_database(sqlite3* from, sqlite3* to, const std::string& path) {
        sqlite3_backup* bk = sqlite3_backup_init(to, "main", from, "main");
        if (!bk) THROW("backup init failed for '%s': %s", path.c_str(), db_error(to).c_str());
        int rc = SQLITE_OK;
        do {
            rc = sqlite3_backup_step(bk, -1);
            if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) sqlite3_sleep(50);
        } while (rc == SQLITE_OK || rc == SQLITE_BUSY || rc == SQLITE_LOCKED);
        sqlite3_backup_finish(bk);
        if (rc != SQLITE_DONE) {
            THROW("backup copy failed for '%s': %s", path.c_str(), sqlite3_errstr(rc));
        }
    }

    sqlite3* db_ = nullptr;
    int busy_timeout_ms_;
};

PSQLConnection make_sqlite_connection(int busy_timeout_ms) {
    return std::make_unique<SQLiteConnection>(busy_timeout_ms);
}
