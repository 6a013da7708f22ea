#pragma once
#include <optional>
#include <string>
#include <vector>
#include "sqlconnection.hpp"

#define LEDGER_TABLE "migrations"

struct LedgerEntry {
    std::string version;
    std::string executed_at; // ISO-8601 UTC
    bool success = false;
    int batch = 0;
    int64_t seq = 0;         // execution order across batches
    int64_t execution_ms = 0;
    std::string backup_path;
};

// Persisted record of executed versions, kept in the target database itself.
// Every method works on the caller's connection so writes can share the migration transaction.
class MigrationLedger {
public:
    void ensure(SQLConnection& conn);

    // all entries by execution order
    std::vector<LedgerEntry> entries(SQLConnection& conn);
    std::vector<LedgerEntry> successful(SQLConnection& conn);
    std::optional<LedgerEntry> find(SQLConnection& conn, const std::string& version);

    int next_batch(SQLConnection& conn);

    // Inserts or replaces the entry for @p entry.version; a successful entry is never replaced.
    // seq is assigned here when zero.
    void record(SQLConnection& conn, LedgerEntry entry);
    void remove(SQLConnection& conn, const std::string& version);

    // squash: the entries of @p versions collapse into one successful entry for @p baseline
    void collapse(SQLConnection& conn, const StrList& versions, const std::string& baseline);

private:
    int64_t next_seq(SQLConnection& conn);
};
