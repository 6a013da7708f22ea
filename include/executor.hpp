#pragma once
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "backup.hpp"
#include "dbpool.hpp"
#include "generator.hpp"
#include "ledger.hpp"
#include "migration.hpp"
#include "store.hpp"

struct ExecutorOptions {
    bool dry_run = false;  // migrate() previews instead of executing
    bool parallel = false; // run consecutive canRunInParallel records concurrently
};

struct MigrationStatus {
    std::string version;
    std::string description;
    enum class State { Pending, Executed, Failed } state = State::Pending;
    std::string executed_at;
    int batch = 0;
    int64_t execution_ms = 0;
    bool known = true; // false for ledger entries without a record
};

struct MigrateResult {
    int batch = 0;
    StrList executed;
    StrList preview; // dry run only
};

/**
 * @brief Orders, validates, runs and rolls back migration records against one database.
 *
 * The ledger lives in the target database (table "migrations"). A record's
 * ledger row is written inside the same transaction as its up(), right before
 * commit, so a commit is the only durability boundary.
 *
 * Records come from a MigrationStore or are registered programmatically with add().
 */
class MigrationExecutor {
public:
    /**
     * @param db pool of the target database
     * @param backups backup manager of the same database, may be null when no
     *        record requires a backup
     * @param records known records, any order; versions must be unique
     */
    MigrationExecutor(pool::IDbPool& db, BackupManager* backups, std::vector<MigrationRecord> records = {},
        ExecutorOptions opts = {});

    void add(MigrationRecord record);
    const std::vector<MigrationRecord>& records() const { return records_; }
    const MigrationRecord* find(const std::string& version) const;

    ExecutorOptions& options() { return opts_; }

    // known records without a successful ledger entry, by version
    std::vector<const MigrationRecord*> pending();

    /**
     * @brief Runs every pending record in version order, as one batch.
     *
     * Dependency and conflict checks run before any SQL. A record's validate()
     * and expectations are checked against the live schema right before it runs.
     * The first failure is recovered (rollback, best-effort down(), backup
     * restore, failed ledger entry) and re-raised as TransactionError; nothing
     * after it runs.
     *
     * With options().dry_run the previews are returned and nothing executes.
     */
    MigrateResult migrate();

    // preview of every pending record, checks included
    StrList dry_run();

    /**
     * @brief Reverts the @p steps most recently executed records, newest first.
     *
     * Each down() and the removal of its ledger entry share one transaction.
     * @return reverted versions, in the order they were reverted
     */
    StrList rollback(int steps = 1);
    // reverts every record executed after @p version, @p version included
    StrList rollback_to(const std::string& version);
    StrList rollback_all();

    std::vector<MigrationStatus> status();

    // rollback_all() then migrate()
    MigrateResult refresh(bool force);
    // drops every table, recreates the ledger, then migrate()
    MigrateResult fresh(bool force);

    /**
     * @brief Squashes records[from..to] into a baseline and updates @p store and the ledger.
     *
     * The ledger collapses only when the whole run was executed; a run executed
     * in part is a SquashError. Nothing changes when the run was never executed.
     */
    SquashResult squash(const std::string& from, const std::string& to, MigrationStore& store,
        MigrationGenerator& generator, const ConnectionFactory& scratch);

private:
    void check_dependencies(const std::vector<const MigrationRecord*>& pending, const std::set<std::string>& done);
    void check_conflicts(const std::vector<const MigrationRecord*>& pending);
    void check_backups(const std::vector<const MigrationRecord*>& pending);
    void validate(SQLConnection& conn, const MigrationRecord& record);
    std::set<std::string> successful_versions();

    void run_one(const MigrationRecord& record, int batch);
    void run_group(const std::vector<const MigrationRecord*>& group, int batch);
    void recover(const MigrationRecord& record, int batch, const std::optional<BackupFile>& backup,
        int64_t elapsed_ms);
    StrList revert(const std::vector<LedgerEntry>& newest_last, size_t count);

    pool::IDbPool& db_;
    BackupManager* backups_;
    std::vector<MigrationRecord> records_;
    ExecutorOptions opts_;
    MigrationLedger ledger_;
    std::mutex ledger_mx_;
};
