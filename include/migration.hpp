#pragma once
#include <functional>
#include <set>
#include <string>
#include <vector>
#include "schema.hpp"
#include "sqlconnection.hpp"

using MigrationFn = std::function<void(SQLConnection&)>;
using DryRunFn = std::function<StrList(SQLConnection&)>;
// returns the problems found, empty when the record may run
using ValidateFn = std::function<StrList(const SchemaSnapshot&)>;

// Precondition on the live schema, serialized as "table:t", "!table:t",
// "column:t.c", "!column:t.c", "index:i" or "!index:i"
struct SchemaExpectation {
    enum class Kind { Table, Column, Index };
    Kind kind;
    bool present = true;
    std::string table;
    std::string name;

    std::string str() const;
    static SchemaExpectation parse(const std::string& text);
    // empty when satisfied, else a description of the mismatch
    std::string check(const SchemaSnapshot& schema) const;
};

struct MigrationRecord {
    std::string version;
    std::string description;
    bool is_destructive = false;
    bool requires_backup = false;
    bool auto_rollback_on_error = true;
    std::set<std::string> depends_on;
    std::set<std::string> conflicts_with;
    bool can_run_in_parallel = false;
    StrList squashed; // versions a baseline replaced

    MigrationFn up;
    MigrationFn down;
    DryRunFn dry_run;    // optional
    ValidateFn validate; // optional

    // statement bodies of SQL-backed records, persisted by MigrationStore
    StrList up_sql;
    StrList down_sql;
    std::vector<SchemaExpectation> expects;

    bool sql_backed() const { return !up_sql.empty() || !down_sql.empty(); }
};

// Runs statements in order. A rejected statement surfaces as SqlError naming it.
void run_statements(SQLConnection& conn, const StrList& statements);

// Binds up/down/dry_run/validate of @p record to its SQL lists and expectations
void bind_sql(MigrationRecord& record);

MigrationRecord make_sql_migration(const std::string& version, StrList up, StrList down,
    std::string description = "");

// [0-9A-Za-z.-]+, sorts as text
bool is_valid_version(const std::string& version);

// Current UTC timestamp YYYYMMDDHHMMSSmmm, moved past @p newest_known when it would not sort after it
std::string next_version(const std::string& newest_known = "");
