#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <functional>
#include <cstdarg>
#include <cstdio>
#include <sstream>

using str = std::string;
using er = std::runtime_error;
using StrList = std::vector<std::string>;

void error(const std::string& msg, const char* file, int line, ...);
std::string where(const char* file, int line, const std::string& msg);

// A helper macro to automatically pass __FILE__ and __LINE__
#define THROW(msg, ...) error(msg, __FILE__, __LINE__, ##__VA_ARGS__)
// Same, for one of the typed errors below
#define THROW_AS(Type, msg) throw Type(where(__FILE__, __LINE__, msg))

/****************** ERROR TAXONOMY */

class MigrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// rename candidate without an explicit confirm/deny decision
class DiffAmbiguityError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

// snapshot with duplicate columns or an invalid identifier
class MalformedSnapshotError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class MigrationDependencyError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class MigrationConflictError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class MigrationValidationError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

// statement rejected by the database while running up/down
class TransactionError : public MigrationError {
public:
    TransactionError(const std::string& msg, std::string version, std::string statement)
        : MigrationError(msg)
        , version_(std::move(version))
        , statement_(std::move(statement)) { }

    const std::string& version() const { return version_; }
    const std::string& statement() const { return statement_; }

private:
    std::string version_;
    std::string statement_;
};

class BackupNotFoundError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class DestructiveWithoutForceError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class SquashError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class LedgerError : public MigrationError {
public:
    using MigrationError::MigrationError;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Thrown by SQLConnection when the database rejects a statement.
// Carries the statement so callers can attach it to a TransactionError.
class SqlError : public std::runtime_error {
public:
    SqlError(const std::string& msg, std::string statement)
        : std::runtime_error(msg)
        , statement_(std::move(statement)) { }
    const std::string& statement() const { return statement_; }

private:
    std::string statement_;
};

/****************** SMALL HELPERS */

// runs a callable on scope exit
struct Finally {
    std::function<void()> f;
    explicit Finally(std::function<void()> fn)
        : f(std::move(fn)) { }
    ~Finally() {
        if (f) {
            f();
        }
    }
    Finally(const Finally&) = delete;
    Finally& operator=(const Finally&) = delete;
    Finally(Finally&& other) noexcept
        : f(std::move(other.f)) { }
    Finally& operator=(Finally&& other) noexcept {
        f = std::move(other.f);
        return *this;
    }
};

std::string join(const StrList& items, const std::string& sep);
std::string to_upper(std::string s);
std::string to_lower(std::string s);
std::string trim(const std::string& s);

// [A-Za-z_][A-Za-z0-9_]*
bool is_identifier(const std::string& s);

// UTC "YYYYMMDDHHMMSSmmm" for the current instant or for a unix time in ms
std::string timestamp_ms();
std::string timestamp_ms(int64_t unix_ms);
// inverse of timestamp_ms, returns -1 when @p ts is not in that format
int64_t parse_timestamp_ms(const std::string& ts);
int64_t now_ms();
// ISO-8601 UTC, for ledger rows and reports
std::string iso_utc(int64_t unix_ms);
