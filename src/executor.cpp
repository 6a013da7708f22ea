#include "executor.hpp"
#include "introspector.hpp"
#include "log.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <thread>

namespace {

const logging::Logger& exec_log() {
    static const logging::Logger log { logging::EXECUTOR_LOGGER };
    return log;
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

// union-find over version strings
struct Components {
    std::map<std::string, std::string> parent;

    std::string root(const std::string& v) {
        auto it = parent.find(v);
        if (it == parent.end()) {
            parent[v] = v;
            return v;
        }
        if (it->second == v) return v;
        std::string r = root(it->second);
        parent[v] = r;
        return r;
    }
    void unite(const std::string& a, const std::string& b) {
        std::string ra = root(a), rb = root(b);
        if (ra != rb) parent[ra] = rb;
    }
};

} // anonymous namespace

MigrationExecutor::MigrationExecutor(pool::IDbPool& db, BackupManager* backups, std::vector<MigrationRecord> records,
    ExecutorOptions opts)
    : db_(db)
    , backups_(backups)
    , opts_(opts) {
    for (auto& r : records) add(std::move(r));
}

void MigrationExecutor::add(MigrationRecord record) {
    if (!is_valid_version(record.version)) THROW_AS(MigrationError, "invalid migration version '" + record.version + "'");
    if (find(record.version)) THROW_AS(MigrationError, "duplicate migration version " + record.version);
    auto pos = std::upper_bound(records_.begin(), records_.end(), record.version,
        [](const std::string& v, const MigrationRecord& r) { return v < r.version; });
    records_.insert(pos, std::move(record));
}

const MigrationRecord* MigrationExecutor::find(const std::string& version) const {
    for (const auto& r : records_) {
        if (r.version == version) return &r;
    }
    return nullptr;
}

std::set<std::string> MigrationExecutor::successful_versions() {
    return pool::with_conn(db_, pool::DbIntent::Read, [&](SQLConnection& conn) {
        ledger_.ensure(conn);
        std::set<std::string> out;
        for (const auto& e : ledger_.successful(conn)) out.insert(e.version);
        return out;
    });
}

std::vector<const MigrationRecord*> MigrationExecutor::pending() {
    auto done = successful_versions();
    std::vector<const MigrationRecord*> out;
    for (const auto& r : records_) {
        if (!done.count(r.version)) out.push_back(&r);
    }
    return out;
}

void MigrationExecutor::check_dependencies(const std::vector<const MigrationRecord*>& pending,
    const std::set<std::string>& done) {
    std::set<std::string> satisfied = done;
    for (const auto* r : pending) {
        for (const auto& dep : r->depends_on) {
            if (satisfied.count(dep)) continue;
            std::string why = find(dep) ? "which has not run and does not come before it" : "which is unknown";
            THROW_AS(MigrationDependencyError, "migration " + r->version + " depends on " + dep + " " + why);
        }
        satisfied.insert(r->version);
    }
}

void MigrationExecutor::check_conflicts(const std::vector<const MigrationRecord*>& pending) {
    Components graph;
    for (const auto& r : records_) {
        graph.root(r.version);
        for (const auto& c : r.conflicts_with) graph.unite(r.version, c);
    }
    std::map<std::string, StrList> by_component;
    for (const auto* r : pending) by_component[graph.root(r->version)].push_back(r->version);
    for (const auto& [root, members] : by_component) {
        if (members.size() > 1) {
            THROW_AS(MigrationConflictError, "pending migrations conflict with each other: " + join(members, ", "));
        }
    }
}

void MigrationExecutor::check_backups(const std::vector<const MigrationRecord*>& pending) {
    if (backups_) return;
    for (const auto* r : pending) {
        if (r->requires_backup) {
            THROW_AS(MigrationError, "migration " + r->version + " requires a backup but no backup directory is configured");
        }
    }
}

void MigrationExecutor::validate(SQLConnection& conn, const MigrationRecord& record) {
    if (!record.validate) return;
    SchemaSnapshot live = SchemaIntrospector(conn, { LEDGER_TABLE }).snapshot();
    StrList problems = record.validate(live);
    if (!problems.empty()) {
        THROW_AS(MigrationValidationError, "migration " + record.version + " cannot run: " + join(problems, "; "));
    }
}

MigrateResult MigrationExecutor::migrate() {
    MigrateResult result;
    auto done = successful_versions();
    std::vector<const MigrationRecord*> todo;
    for (const auto& r : records_) {
        if (!done.count(r.version)) todo.push_back(&r);
    }
    check_dependencies(todo, done);
    check_conflicts(todo);

    if (opts_.dry_run) {
        result.preview = dry_run();
        return result;
    }
    check_backups(todo);
    for (const auto* r : todo) {
        if (!r->up) THROW_AS(MigrationError, "migration " + r->version + " has no up operation");
    }
    if (todo.empty()) {
        exec_log().info("nothing to migrate");
        return result;
    }

    result.batch = pool::with_conn(db_, pool::DbIntent::Read, [&](SQLConnection& conn) { return ledger_.next_batch(conn); });
    exec_log().info("batch {}: {} pending migration(s)", result.batch, todo.size());

    std::set<std::string> executed = done;
    size_t i = 0;
    while (i < todo.size()) {
        std::vector<const MigrationRecord*> group;
        if (opts_.parallel) {
            for (size_t j = i; j < todo.size() && group.size() < db_.capacity(); ++j) {
                const MigrationRecord* r = todo[j];
                bool ready = std::all_of(r->depends_on.begin(), r->depends_on.end(),
                    [&](const std::string& d) { return executed.count(d) > 0; });
                if (!r->can_run_in_parallel || r->requires_backup || !ready) break;
                group.push_back(r);
            }
        }
        if (group.size() > 1) {
            run_group(group, result.batch);
        } else {
            group = { todo[i] };
            run_one(*todo[i], result.batch);
        }
        for (const auto* r : group) {
            executed.insert(r->version);
            result.executed.push_back(r->version);
        }
        i += group.size();
    }
    exec_log().info("batch {}: {} migration(s) executed", result.batch, result.executed.size());
    return result;
}

StrList MigrationExecutor::dry_run() {
    auto done = successful_versions();
    std::vector<const MigrationRecord*> todo;
    for (const auto& r : records_) {
        if (!done.count(r.version)) todo.push_back(&r);
    }
    check_dependencies(todo, done);
    check_conflicts(todo);

    StrList out;
    pool::with_conn(db_, pool::DbIntent::Read, [&](SQLConnection& conn) {
        for (const auto* r : todo) {
            std::string header = "-- " + r->version;
            if (!r->description.empty()) header += " " + r->description;
            if (r->requires_backup) header += " [backup]";
            out.push_back(header);
            if (!r->dry_run) {
                out.push_back("-- (no preview available)");
                continue;
            }
            for (auto& line : r->dry_run(conn)) out.push_back(std::move(line));
        }
    });
    return out;
}

void MigrationExecutor::run_one(const MigrationRecord& record, int batch) {
    pool::with_conn(db_, pool::DbIntent::Read, [&](SQLConnection& conn) { validate(conn, record); });

    std::optional<BackupFile> backup;
    if (record.requires_backup) backup = backups_->create(record.version);

    exec_log().info("migrating {}", record.version);
    auto started = std::chrono::steady_clock::now();
    std::exception_ptr failure;
    {
        pool::Lease lease = db_.lease(pool::DbIntent::Write);
        SQLConnection& conn = lease.conn();
        try {
            Transaction tr(conn);
            record.up(conn);

            LedgerEntry entry;
            entry.version = record.version;
            entry.success = true;
            entry.batch = batch;
            entry.execution_ms = elapsed_ms(started);
            if (backup) entry.backup_path = backup->path;

            std::lock_guard<std::mutex> lk(ledger_mx_);
            ledger_.record(conn, entry);
            tr.commit();
        } catch (const std::exception&) {
            failure = std::current_exception();
        }

        if (failure && record.auto_rollback_on_error && record.down) {
            try {
                Transaction tr(conn);
                record.down(conn);
                tr.commit();
            } catch (const std::exception& e) {
                exec_log().warn("best-effort down of {} failed: {}", record.version, e.what());
            }
        }
    }

    if (!failure) {
        exec_log().info("migrated {} ({} ms)", record.version, elapsed_ms(started));
        return;
    }

    std::string what, statement;
    try {
        std::rethrow_exception(failure);
    } catch (const SqlError& e) {
        what = e.what();
        statement = e.statement();
    } catch (const TransactionError& e) {
        what = e.what();
        statement = e.statement();
    } catch (const std::exception& e) {
        what = e.what();
    }
    exec_log().error("migration {} failed: {}", record.version, what);
    recover(record, batch, backup, elapsed_ms(started));
    throw TransactionError("migration " + record.version + " failed: " + what, record.version, statement);
}

void MigrationExecutor::recover(const MigrationRecord& record, int batch, const std::optional<BackupFile>& backup,
    int64_t elapsed) {
    if (record.auto_rollback_on_error && backup) {
        try {
            backups_->restore(record.version);
        } catch (const std::exception& e) {
            exec_log().error("restoring the backup of {} failed: {}", record.version, e.what());
        }
    }

    LedgerEntry entry;
    entry.version = record.version;
    entry.success = false;
    entry.batch = batch;
    entry.execution_ms = elapsed;
    if (backup) entry.backup_path = backup->path;
    try {
        pool::with_tr(db_, pool::DbIntent::Write, [&](SQLConnection& conn) { ledger_.record(conn, entry); });
    } catch (const std::exception& e) {
        exec_log().error("cannot record the failure of {}: {}", record.version, e.what());
    }
}

void MigrationExecutor::run_group(const std::vector<const MigrationRecord*>& group, int batch) {
    StrList versions;
    for (const auto* r : group) versions.push_back(r->version);
    exec_log().info("running {} migrations concurrently: {}", group.size(), join(versions, ", "));

    std::vector<std::exception_ptr> failures(group.size());
    std::vector<std::thread> workers;
    workers.reserve(group.size());
    for (size_t i = 0; i < group.size(); ++i) {
        workers.emplace_back([&, i]() {
            try {
                run_one(*group[i], batch);
            } catch (const std::exception&) {
                failures[i] = std::current_exception();
            }
        });
    }
    for (auto& t : workers) t.join();

    for (auto& f : failures) {
        if (f) std::rethrow_exception(f);
    }
}

StrList MigrationExecutor::revert(const std::vector<LedgerEntry>& newest_last, size_t count) {
    count = std::min(count, newest_last.size());
    std::vector<const MigrationRecord*> targets;
    for (size_t k = 0; k < count; ++k) {
        const LedgerEntry& e = newest_last[newest_last.size() - 1 - k];
        const MigrationRecord* r = find(e.version);
        if (!r) THROW_AS(MigrationError, "no migration record for executed version " + e.version);
        if (!r->down) THROW_AS(MigrationError, "migration " + e.version + " has no down operation");
        targets.push_back(r);
    }

    StrList reverted;
    for (const auto* r : targets) {
        exec_log().info("rolling back {}", r->version);
        pool::Lease lease = db_.lease(pool::DbIntent::Write);
        SQLConnection& conn = lease.conn();
        try {
            Transaction tr(conn);
            r->down(conn);
            ledger_.remove(conn, r->version);
            tr.commit();
        } catch (const SqlError& e) {
            throw TransactionError("rollback of " + r->version + " failed: " + e.what(), r->version, e.statement());
        }
        reverted.push_back(r->version);
    }
    return reverted;
}

StrList MigrationExecutor::rollback(int steps) {
    if (steps < 1) THROW_AS(MigrationError, "rollback steps must be at least 1");
    auto entries = pool::with_conn(db_, pool::DbIntent::Read, [&](SQLConnection& conn) {
        ledger_.ensure(conn);
        return ledger_.successful(conn);
    });
    return revert(entries, static_cast<size_t>(steps));
}

StrList MigrationExecutor::rollback_to(const std::string& version) {
    auto entries = pool::with_conn(db_, pool::DbIntent::Read, [&](SQLConnection& conn) {
        ledger_.ensure(conn);
        return ledger_.successful(conn);
    });
    auto it = std::find_if(entries.begin(), entries.end(), [&](const LedgerEntry& e) { return e.version == version; });
    if (it == entries.end()) THROW_AS(MigrationError, "version " + version + " has not been executed");
    return revert(entries, static_cast<size_t>(entries.end() - it));
}

StrList MigrationExecutor::rollback_all() {
    auto entries = pool::with_conn(db_, pool::DbIntent::Read, [&](SQLConnection& conn) {
        ledger_.ensure(conn);
        return ledger_.successful(conn);
    });
    return revert(entries, entries.size());
}

std::vector<MigrationStatus> MigrationExecutor::status() {
    auto entries = pool::with_conn(db_, pool::DbIntent::Read, [&](SQLConnection& conn) {
        ledger_.ensure(conn);
        return ledger_.entries(conn);
    });
    std::map<std::string, LedgerEntry> by_version;
    for (auto& e : entries) by_version[e.version] = e;

    std::vector<MigrationStatus> out;
    auto fill = [](MigrationStatus& s, const LedgerEntry& e) {
        s.state = e.success ? MigrationStatus::State::Executed : MigrationStatus::State::Failed;
        s.executed_at = e.executed_at;
        s.batch = e.batch;
        s.execution_ms = e.execution_ms;
    };
    for (const auto& r : records_) {
        MigrationStatus s;
        s.version = r.version;
        s.description = r.description;
        auto it = by_version.find(r.version);
        if (it != by_version.end()) {
            fill(s, it->second);
            by_version.erase(it);
        }
        out.push_back(s);
    }
    for (const auto& [version, e] : by_version) {
        MigrationStatus s;
        s.version = version;
        s.known = false;
        fill(s, e);
        out.push_back(s);
    }
    std::sort(out.begin(), out.end(), [](const MigrationStatus& a, const MigrationStatus& b) { return a.version < b.version; });
    return out;
}

MigrateResult MigrationExecutor::refresh(bool force) {
    if (!force) THROW_AS(DestructiveWithoutForceError, "refresh reverts every migration; pass --force");
    rollback_all();
    return migrate();
}

MigrateResult MigrationExecutor::fresh(bool force) {
    if (!force) THROW_AS(DestructiveWithoutForceError, "fresh drops every table; pass --force");
    pool::with_tr(db_, pool::DbIntent::Write, [&](SQLConnection& conn) {
        auto rows = conn.query("SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%'");
        for (const auto& row : rows) {
            std::string name = row.at(0).value_or("");
            exec_log().warn("dropping table {}", name);
            conn.execute("DROP TABLE IF EXISTS \"" + name + "\"");
        }
        ledger_.ensure(conn);
    });
    return migrate();
}

SquashResult MigrationExecutor::squash(const std::string& from, const std::string& to, MigrationStore& store,
    MigrationGenerator& generator, const ConnectionFactory& scratch) {
    SquashResult result = generator.squash(records_, from, to, scratch);

    auto done = successful_versions();
    size_t ran = 0;
    for (const auto& v : result.replaced) ran += done.count(v);
    if (ran != 0 && ran != result.replaced.size()) {
        THROW_AS(SquashError, "only " + std::to_string(ran) + " of " + std::to_string(result.replaced.size())
                + " migrations in the range have been executed");
    }

    // the ledger collapse commits only once the artifacts are replaced
    if (ran != 0) {
        pool::with_tr(db_, pool::DbIntent::Write, [&](SQLConnection& conn) {
            ledger_.collapse(conn, result.replaced, result.baseline.version);
            store.replace(result.replaced, result.baseline);
        });
    } else {
        store.replace(result.replaced, result.baseline);
    }

    std::erase_if(records_, [&](const MigrationRecord& r) {
        return std::find(result.replaced.begin(), result.replaced.end(), r.version) != result.replaced.end();
    });
    add(result.baseline);
    return result;
}
