#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include "lib.hpp"

// a NULL column reads as std::nullopt
using SqlValue = std::optional<std::string>;
using SqlRow = std::vector<SqlValue>;
using SqlRows = std::vector<SqlRow>;

class SQLStatement {
public:
    virtual ~SQLStatement() = default;

    virtual void bind_text(int idx, const std::string& value) = 0;
    virtual void bind_int(int idx, int64_t value) = 0;
    virtual void bind_null(int idx) = 0;

    // Advance one row. true while a row is available.
    virtual bool step() = 0;
    virtual int column_count() = 0;
    virtual SqlValue column(int idx) = 0;

    // Run to completion, return rows affected
    virtual int exec() = 0;
    virtual void reset() = 0;

    void bind(int idx, const SqlValue& value) {
        if (value) bind_text(idx, *value);
        else bind_null(idx);
    }

    const std::string& sql() const { return sql_; }

protected:
    std::string sql_;
};

class SQLConnection {
public:
    virtual ~SQLConnection() = default;

    // SQLite: file path or ":memory:"
    virtual void connect(const std::string& dsn) = 0;

    // Safe to call multiple times.
    virtual void disconnect() = 0;
    virtual bool is_open() const = 0;

    virtual std::unique_ptr<SQLStatement> prepare(const std::string& sql) = 0;

    // One or more statements without parameters. Throws SqlError.
    virtual int execute(const std::string& sql) = 0;

    virtual bool begin() = 0;
    virtual bool commit() = 0;
    virtual void rollback() = 0;
    bool in_transaction() const { return tr_started_; }

    // Full copy of the database to/from a file
    virtual void export_to(const std::string& path) = 0;
    virtual void import_from(const std::string& path) = 0;

    // Runs a query with positional text parameters and collects every row.
    SqlRows query(const std::string& sql, const std::vector<SqlValue>& params = {}) {
        auto stmt = prepare(sql);
        for (size_t i = 0; i < params.size(); ++i) stmt->bind(static_cast<int>(i) + 1, params[i]);
        SqlRows rows;
        while (stmt->step()) {
            SqlRow row;
            int n = stmt->column_count();
            row.reserve(n);
            for (int c = 0; c < n; ++c) row.push_back(stmt->column(c));
            rows.push_back(std::move(row));
        }
        return rows;
    }

    const std::string& dsn() const { return dsn_; }

protected:
    bool tr_started_ = false;
    std::string dsn_;
};

// Helpers for ownership
using PSQLConnection = std::unique_ptr<SQLConnection>;

PSQLConnection make_sqlite_connection(int busy_timeout_ms = 5000);

// Transaction scope: begins on construction, rolls back on destruction unless committed.
class Transaction {
public:
    explicit Transaction(SQLConnection& conn)
        : conn_(conn) {
        if (!conn_.begin()) THROW("begin() failed");
        active_ = true;
    }

    ~Transaction() {
        if (!active_) return;
        try {
            conn_.rollback();
        } catch (const std::exception&) {
            // the connection already reported the failure; nothing left to undo
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        if (!active_) THROW("commit() on a finished transaction");
        if (!conn_.commit()) {
            rollback();
            THROW("commit() failed - transaction rolled back");
        }
        active_ = false;
    }

    void rollback() {
        if (!active_) return;
        active_ = false;
        conn_.rollback();
    }

    bool active() const { return active_; }
    SQLConnection& conn() { return conn_; }

private:
    SQLConnection& conn_;
    bool active_ = false;
};
