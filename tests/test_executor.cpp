#include "catch2/catch.hpp"
#include "executor.hpp"
#include "fake_sql.hpp"
#include "introspector.hpp"
#include <algorithm>

namespace {

MigrationRecord sql_record(const std::string& version, StrList up, StrList down, const std::string& description = "") {
    return make_sql_migration(version, std::move(up), std::move(down), description);
}

MigrationRecord create_users() {
    return sql_record("001", { "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT)" }, { "DROP TABLE users" },
        "create users");
}

MigrationRecord add_email() {
    return sql_record("002", { "ALTER TABLE users ADD COLUMN email VARCHAR(255)" },
        { "ALTER TABLE users DROP COLUMN email" }, "add email");
}

MigrationRecord create_table(const std::string& version, const std::string& table) {
    return sql_record(version, { "CREATE TABLE " + table + " (id INTEGER)" }, { "DROP TABLE " + table });
}

struct ExecutorFixture {
    ExecutorFixture()
        : db(2, dir.file("app.db"), []() { return make_sqlite_connection(5000); }) { }

    StrList ledger_versions(bool only_successful = true) {
        return pool::with_conn(db, pool::DbIntent::Read, [&](SQLConnection& conn) {
            MigrationLedger ledger;
            ledger.ensure(conn);
            StrList out;
            for (const auto& e : only_successful ? ledger.successful(conn) : ledger.entries(conn)) out.push_back(e.version);
            return out;
        });
    }

    std::optional<LedgerEntry> ledger_entry(const std::string& version) {
        return pool::with_conn(db, pool::DbIntent::Read, [&](SQLConnection& conn) {
            MigrationLedger ledger;
            ledger.ensure(conn);
            return ledger.find(conn, version);
        });
    }

    SchemaSnapshot schema() {
        return pool::with_conn(db, pool::DbIntent::Read,
            [](SQLConnection& conn) { return SchemaIntrospector(conn, { LEDGER_TABLE }).snapshot(); });
    }

    TempDir dir;
    DbPool db;
};

} // anonymous namespace

TEST_CASE_METHOD(ExecutorFixture, "Pending migrations run in version order", "[executor][scenario]") {
    MigrationExecutor exec(db, nullptr, { add_email(), create_users() });
    REQUIRE(exec.pending().size() == 2);

    MigrateResult res = exec.migrate();
    CHECK(res.batch == 1);
    CHECK(res.executed == StrList { "001", "002" });
    CHECK(ledger_versions() == StrList { "001", "002" });
    CHECK(schema().table("users")->column("email"));
    CHECK(exec.pending().empty());

    MigrateResult again = exec.migrate();
    CHECK(again.executed.empty());

    exec.add(create_table("003", "tags"));
    CHECK(exec.migrate().batch == 2);
    CHECK(ledger_entry("003")->batch == 2);
}

TEST_CASE_METHOD(ExecutorFixture, "Rolling back reverts the newest migrations", "[executor][rollback][scenario]") {
    MigrationExecutor exec(db, nullptr, { create_users(), add_email(), create_table("003", "tags") });
    exec.migrate();
    SECTION("two steps") {
        CHECK(exec.rollback(2) == StrList { "003", "002" });
        CHECK(ledger_versions() == StrList { "001" });
        SchemaSnapshot s = schema();
        CHECK(s.tables.size() == 1);
        CHECK(s.table("users")->column_names() == StrList { "id", "name" });
    }
    SECTION("one step removes only the newest entry") {
        CHECK(exec.rollback() == StrList { "003" });
        CHECK(ledger_versions() == StrList { "001", "002" });
        CHECK_FALSE(schema().table("tags"));
    }
    SECTION("down to a version") {
        CHECK(exec.rollback_to("002") == StrList { "003", "002" });
        CHECK(ledger_versions() == StrList { "001" });
        CHECK_THROWS_AS(exec.rollback_to("002"), MigrationError);
    }
    SECTION("everything") {
        CHECK(exec.rollback_all().size() == 3);
        CHECK(ledger_versions().empty());
        CHECK(schema().tables.empty());
    }
    SECTION("more steps than executed") {
        CHECK(exec.rollback(10).size() == 3);
    }
    CHECK_THROWS_AS(exec.rollback(0), MigrationError);
}

TEST_CASE_METHOD(ExecutorFixture, "A failing statement rolls the migration back", "[executor][failure]") {
    MigrationRecord broken = sql_record("002",
        { "CREATE TABLE audit (id INTEGER)", "INSERT INTO missing VALUES (1)" }, { "DROP TABLE audit" });
    MigrationExecutor exec(db, nullptr, { create_users(), broken, create_table("003", "tags") });

    try {
        exec.migrate();
        FAIL("migration did not fail");
    } catch (const TransactionError& e) {
        CHECK(e.version() == "002");
        CHECK(e.statement() == "INSERT INTO missing VALUES (1)");
    }
    CHECK(ledger_versions() == StrList { "001" });
    auto failed = ledger_entry("002");
    REQUIRE(failed);
    CHECK_FALSE(failed->success);
    CHECK_FALSE(ledger_entry("003"));
    CHECK_FALSE(schema().table("audit"));
    CHECK_FALSE(schema().table("tags"));

    auto st = exec.status();
    REQUIRE(st.size() == 3);
    CHECK(st[1].state == MigrationStatus::State::Failed);
    CHECK(st[2].state == MigrationStatus::State::Pending);

    // a corrected record replaces the failed entry
    MigrationExecutor fixed(db, nullptr, { create_users(), create_table("002", "audit"), create_table("003", "tags") });
    MigrateResult res = fixed.migrate();
    CHECK(res.executed == StrList { "002", "003" });
    CHECK(res.batch == 2);
    CHECK(ledger_entry("002")->success);
}

TEST_CASE_METHOD(ExecutorFixture, "Dependency and conflict errors run nothing", "[executor][order]") {
    SECTION("unknown dependency") {
        MigrationRecord r = add_email();
        r.depends_on = { "999" };
        MigrationExecutor exec(db, nullptr, { create_users(), r });
        CHECK_THROWS_AS(exec.migrate(), MigrationDependencyError);
    }
    SECTION("dependency on a later migration") {
        MigrationRecord r = create_users();
        r.depends_on = { "002" };
        MigrationExecutor exec(db, nullptr, { r, add_email() });
        CHECK_THROWS_AS(exec.migrate(), MigrationDependencyError);
    }
    SECTION("pending conflicts, directly or through another record") {
        MigrationRecord a = create_table("003", "a");
        MigrationRecord b = create_table("004", "b");
        MigrationRecord c = create_table("005", "c");
        a.conflicts_with = { "004" };
        c.conflicts_with = { "004" };
        MigrationExecutor exec(db, nullptr, { create_users(), a, c });
        exec.add(b);
        CHECK_THROWS_AS(exec.migrate(), MigrationConflictError);
    }
    CHECK(ledger_versions().empty());
    CHECK(schema().tables.empty());
}

TEST_CASE_METHOD(ExecutorFixture, "Conflicts only matter among pending migrations", "[executor][order]") {
    MigrationExecutor first(db, nullptr, { create_users() });
    first.migrate();

    MigrationRecord r = add_email();
    r.conflicts_with = { "001" };
    MigrationExecutor exec(db, nullptr, { create_users(), r });
    CHECK(exec.migrate().executed == StrList { "002" });
}

TEST_CASE_METHOD(ExecutorFixture, "Validation runs against the live schema before each migration", "[executor][validate]") {
    MigrationRecord r = add_email();
    r.expects = { SchemaExpectation::parse("table:users"), SchemaExpectation::parse("!column:users.email") };
    bind_sql(r);

    SECTION("passes once the earlier migration created the table") {
        MigrationExecutor exec(db, nullptr, { create_users(), r });
        CHECK(exec.migrate().executed.size() == 2);
    }
    SECTION("fails without running") {
        MigrationExecutor exec(db, nullptr, { r });
        CHECK_THROWS_AS(exec.migrate(), MigrationValidationError);
        CHECK_FALSE(ledger_entry("002"));
    }
    SECTION("custom validator") {
        MigrationRecord custom = create_table("001", "t");
        custom.validate = [](const SchemaSnapshot&) { return StrList { "not today" }; };
        MigrationExecutor exec(db, nullptr, { custom });
        CHECK_THROWS_WITH(exec.migrate(), Catch::Contains("not today"));
    }
}

TEST_CASE_METHOD(ExecutorFixture, "A failed validation keeps the earlier migrations of the batch", "[executor][validate]") {
    MigrationRecord refused = create_table("002", "t");
    refused.validate = [](const SchemaSnapshot&) { return StrList { "not yet" }; };
    MigrationExecutor exec(db, nullptr, { create_users(), refused });

    CHECK_THROWS_AS(exec.migrate(), MigrationValidationError);
    CHECK(ledger_versions() == StrList { "001" });
    CHECK_FALSE(ledger_entry("002"));
    CHECK(schema().table("users"));
    CHECK_FALSE(schema().table("t"));
    REQUIRE(exec.pending().size() == 1);
    CHECK(exec.pending()[0]->version == "002");
}

TEST_CASE_METHOD(ExecutorFixture, "Dry run previews without executing", "[executor][dryrun]") {
    MigrationRecord plain;
    plain.version = "003";
    plain.up = [](SQLConnection& conn) { conn.execute("CREATE TABLE t (id INTEGER)"); };
    MigrationExecutor exec(db, nullptr, { create_users(), add_email(), plain });

    StrList preview = exec.dry_run();
    CHECK(preview == StrList {
              "-- 001 create users",
              "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT)",
              "-- 002 add email",
              "ALTER TABLE users ADD COLUMN email VARCHAR(255)",
              "-- 003",
              "-- (no preview available)",
          });

    exec.options().dry_run = true;
    MigrateResult res = exec.migrate();
    CHECK(res.preview == preview);
    CHECK(res.executed.empty());
    CHECK(ledger_versions().empty());
    CHECK(schema().tables.empty());
}

TEST_CASE_METHOD(ExecutorFixture, "Refresh and fresh demand force", "[executor][destructive]") {
    MigrationExecutor exec(db, nullptr, { create_users(), add_email() });
    exec.migrate();
    CHECK_THROWS_AS(exec.refresh(false), DestructiveWithoutForceError);
    CHECK_THROWS_AS(exec.fresh(false), DestructiveWithoutForceError);
    CHECK(ledger_versions().size() == 2);

    CHECK(exec.refresh(true).executed == StrList { "001", "002" });

    pool::with_conn(db, pool::DbIntent::Write, [](SQLConnection& conn) { conn.execute("CREATE TABLE junk (x INTEGER)"); });
    MigrateResult res = exec.fresh(true);
    CHECK(res.executed == StrList { "001", "002" });
    CHECK(res.batch == 1);
    CHECK_FALSE(schema().table("junk"));
}

TEST_CASE_METHOD(ExecutorFixture, "Parallel-capable migrations run as one group", "[executor][parallel]") {
    MigrationRecord a = create_table("002", "a");
    MigrationRecord b = create_table("003", "b");
    a.can_run_in_parallel = b.can_run_in_parallel = true;
    MigrationExecutor exec(db, nullptr, { create_users(), a, b }, ExecutorOptions { false, true });

    MigrateResult res = exec.migrate();
    CHECK(res.executed == StrList { "001", "002", "003" });
    StrList done = ledger_versions();
    std::sort(done.begin(), done.end());
    CHECK(done == StrList { "001", "002", "003" });
    CHECK(schema().table("a"));
    CHECK(schema().table("b"));
}

TEST_CASE_METHOD(ExecutorFixture, "A failing member stops the group and the rest of the batch", "[executor][parallel][failure]") {
    MigrationRecord a = create_table("002", "a");
    MigrationRecord b = sql_record("003", { "CREATE TABLE b (id INTEGER)", "INSERT INTO missing VALUES (1)" },
        { "DROP TABLE b" });
    a.can_run_in_parallel = b.can_run_in_parallel = true;
    MigrationExecutor exec(db, nullptr, { create_users(), a, b, create_table("004", "c") },
        ExecutorOptions { false, true });

    CHECK_THROWS_AS(exec.migrate(), TransactionError);

    auto failed = ledger_entry("003");
    REQUIRE(failed);
    CHECK_FALSE(failed->success);
    REQUIRE(ledger_entry("002"));
    CHECK(ledger_entry("002")->success);
    CHECK_FALSE(ledger_entry("004"));

    SchemaSnapshot s = schema();
    CHECK(s.table("a"));
    CHECK_FALSE(s.table("b"));
    CHECK_FALSE(s.table("c"));
}

TEST_CASE_METHOD(ExecutorFixture, "A failed migration restores its backup", "[executor][backup]") {
    BackupManager backups(db, dir.file("backups"));
    MigrationRecord seed = sql_record("001",
        { "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT)", "INSERT INTO users (name) VALUES ('ann')" },
        { "DROP TABLE users" });
    // the down empties the table again after the rollback, so only the restore brings 'ann' back
    MigrationRecord risky = sql_record("002", { "DELETE FROM users", "INSERT INTO missing VALUES (1)" },
        { "DELETE FROM users" });
    risky.requires_backup = true;
    MigrationExecutor exec(db, &backups, { seed, risky });

    CHECK_THROWS_AS(exec.migrate(), TransactionError);
    auto b = backups.find("002");
    REQUIRE(b);
    CHECK(ledger_entry("002")->backup_path == b->path);
    auto rows = pool::with_conn(db, pool::DbIntent::Read,
        [](SQLConnection& conn) { return conn.query("SELECT name FROM users"); });
    REQUIRE(rows.size() == 1);
    CHECK(rows[0][0] == SqlValue("ann"));
}

TEST_CASE_METHOD(ExecutorFixture, "Recovery ignores older backups of the same version", "[executor][backup]") {
    BackupManager backups(db, dir.file("backups"));
    MigrationRecord seed = sql_record("001",
        { "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT)", "INSERT INTO users (name) VALUES ('ann')" },
        { "DROP TABLE users" });
    MigrationExecutor exec(db, &backups, { seed });
    exec.migrate();

    backups.create("002");
    pool::with_conn(db, pool::DbIntent::Write,
        [](SQLConnection& conn) { conn.execute("INSERT INTO users (name) VALUES ('bob')"); });

    exec.add(sql_record("002", { "INSERT INTO missing VALUES (1)" }, {}));
    CHECK_THROWS_AS(exec.migrate(), TransactionError);

    auto rows = pool::with_conn(db, pool::DbIntent::Read,
        [](SQLConnection& conn) { return conn.query("SELECT name FROM users ORDER BY id"); });
    REQUIRE(rows.size() == 2);
    CHECK(rows[1][0] == SqlValue("bob"));
    REQUIRE(ledger_entry("002"));
    CHECK(ledger_entry("002")->backup_path.empty());
}

TEST_CASE_METHOD(ExecutorFixture, "Backups are required where a migration asks for one", "[executor][backup]") {
    MigrationRecord r = add_email();
    r.requires_backup = true;
    MigrationExecutor exec(db, nullptr, { create_users(), r });
    CHECK_THROWS_AS(exec.migrate(), MigrationError);
    CHECK(ledger_versions().empty());
}

TEST_CASE_METHOD(ExecutorFixture, "Status lists records and orphaned ledger entries", "[executor][status]") {
    pool::with_tr(db, pool::DbIntent::Write, [](SQLConnection& conn) {
        MigrationLedger ledger;
        ledger.ensure(conn);
        LedgerEntry e;
        e.version = "000";
        e.success = true;
        e.batch = 1;
        ledger.record(conn, e);
    });
    MigrationExecutor exec(db, nullptr, { create_users(), add_email() });
    exec.migrate();
    exec.rollback();

    auto st = exec.status();
    REQUIRE(st.size() == 3);
    CHECK(st[0].version == "000");
    CHECK_FALSE(st[0].known);
    CHECK(st[0].state == MigrationStatus::State::Executed);
    CHECK(st[1].version == "001");
    CHECK(st[1].description == "create users");
    CHECK(st[1].state == MigrationStatus::State::Executed);
    CHECK(st[1].batch == 2);
    CHECK(st[2].state == MigrationStatus::State::Pending);

    // the orphan cannot be reverted once it is the newest entry
    exec.rollback();
    CHECK_THROWS_AS(exec.rollback(), MigrationError);
}
