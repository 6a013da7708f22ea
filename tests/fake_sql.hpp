#pragma once
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "sqlconnection.hpp"

// ---- Test fakes ----

class FakeSQLConnection;

class FakeStatement final : public SQLStatement {
public:
    std::vector<SqlValue> binds;
    FakeSQLConnection* owner { nullptr }; // set by connection::prepare

    explicit FakeStatement(const std::string& sql) { sql_ = sql; }

    void bind_text(int idx, const std::string& value) override { put(idx, value); }
    void bind_int(int idx, int64_t value) override { put(idx, std::to_string(value)); }
    void bind_null(int idx) override { put(idx, std::nullopt); }

    bool step() override { return false; } // no rows
    int column_count() override { return 0; }
    SqlValue column(int) override { return std::nullopt; }
    int exec() override; // defined after FakeSQLConnection
    void reset() override { }

private:
    void put(int idx, SqlValue v) {
        if (binds.size() < static_cast<size_t>(idx)) binds.resize(idx);
        binds[idx - 1] = std::move(v);
    }
};

// Records every statement; a statement containing fail_on is rejected with SqlError.
class FakeSQLConnection final : public SQLConnection {
public:
    explicit FakeSQLConnection(int id = 0)
        : id_(id) { }

    int id() const { return id_; }

    StrList executed;      // inspect in tests
    std::string fail_on;   // substring that makes execute()/exec() throw
    int begins { 0 }, commits { 0 }, rollbacks { 0 };
    std::shared_ptr<int> disconnects; // outlives the connection

    void connect(const std::string& dsn) override {
        dsn_ = dsn;
        open_ = true;
    }
    void disconnect() override {
        if (open_ && disconnects) ++*disconnects;
        open_ = false;
    }
    bool is_open() const override { return open_; }

    std::unique_ptr<SQLStatement> prepare(const std::string& sql) override {
        auto stmt = std::make_unique<FakeStatement>(sql);
        stmt->owner = this;
        return stmt;
    }

    int execute(const std::string& sql) override {
        check(sql);
        executed.push_back(sql);
        return 0;
    }

    bool begin() override {
        ++begins;
        tr_started_ = true;
        return true;
    }
    bool commit() override {
        ++commits;
        tr_started_ = false;
        return true;
    }
    void rollback() override {
        ++rollbacks;
        tr_started_ = false;
    }

    void export_to(const std::string&) override { }
    void import_from(const std::string&) override { }

    void check(const std::string& sql) const {
        if (!fail_on.empty() && sql.find(fail_on) != std::string::npos) throw SqlError("rejected: " + sql, sql);
    }

private:
    int id_;
    bool open_ { false };
};

// ---- Inline impls that need full types ----
inline int FakeStatement::exec() {
    if (owner) {
        owner->check(sql_);
        owner->executed.push_back(sql_);
    }
    return 1; // rows affected
}

// Scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("dbshift_test_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};
