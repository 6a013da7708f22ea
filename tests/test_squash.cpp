#include "catch2/catch.hpp"
#include "executor.hpp"
#include "fake_sql.hpp"
#include "introspector.hpp"
#include <algorithm>
#include <filesystem>

namespace {

const ConnectionFactory scratch = []() { return make_sqlite_connection(); };

std::vector<MigrationRecord> history() {
    return {
        make_sql_migration("001", { "CREATE TABLE users (id INTEGER NOT NULL, fullname TEXT, PRIMARY KEY (id))" },
            { "DROP TABLE users" }, "create users"),
        make_sql_migration("002",
            { "ALTER TABLE users RENAME COLUMN fullname TO full_name", "ALTER TABLE users ADD COLUMN age INTEGER DEFAULT 0" },
            { "ALTER TABLE users DROP COLUMN age", "ALTER TABLE users RENAME COLUMN full_name TO fullname" }, "rename"),
        make_sql_migration("003",
            { "CREATE TABLE tags (id INTEGER, label VARCHAR(40))", "CREATE INDEX idx_tags_label ON tags (label)" },
            { "DROP TABLE tags" }, "tags"),
    };
}

SchemaSnapshot replay(const std::vector<MigrationRecord>& records) {
    auto conn = make_sqlite_connection();
    conn->connect(":memory:");
    for (const auto& r : records) {
        Transaction tr(*conn);
        r.up(*conn);
        tr.commit();
    }
    return SchemaIntrospector(*conn).snapshot();
}

StrList versions_of(const std::vector<MigrationRecord>& records) {
    StrList out;
    for (const auto& r : records) out.push_back(r.version);
    return out;
}

} // anonymous namespace

TEST_CASE("A squashed baseline builds the same schema as its history", "[squash]") {
    auto records = history();
    MigrationGenerator gen;
    SquashResult res = gen.squash(records, "", "003", scratch);

    CHECK(res.replaced == StrList { "001", "002", "003" });
    CHECK(res.baseline.version == "003");
    CHECK(res.baseline.squashed == res.replaced);
    CHECK(replay({ res.baseline }) == replay(records));
}

TEST_CASE("Squashing a later range keeps renames as renames", "[squash][rename]") {
    auto records = history();
    MigrationGenerator gen;
    SquashResult res = gen.squash(records, "002", "003", scratch);

    CHECK(res.replaced == StrList { "002", "003" });
    const StrList& up = res.baseline.up_sql;
    CHECK(std::find(up.begin(), up.end(), "ALTER TABLE users RENAME COLUMN fullname TO full_name") != up.end());
    CHECK(replay({ records[0], res.baseline }) == replay(records));

    // and it still reverts to the state before the range
    auto conn = make_sqlite_connection();
    conn->connect(":memory:");
    records[0].up(*conn);
    SchemaSnapshot before = SchemaIntrospector(*conn).snapshot();
    res.baseline.up(*conn);
    res.baseline.down(*conn);
    CHECK(SchemaIntrospector(*conn).snapshot() == before);
}

TEST_CASE("Squash refuses ranges it cannot replace", "[squash][error]") {
    auto records = history();
    MigrationGenerator gen;

    SECTION("single record") {
        CHECK_THROWS_AS(gen.squash(records, "002", "002", scratch), SquashError);
    }
    SECTION("unknown version") {
        CHECK_THROWS_AS(gen.squash(records, "", "009", scratch), SquashError);
    }
    SECTION("outside record depends on the middle of the range") {
        MigrationRecord later = make_sql_migration("004", { "CREATE TABLE x (id INTEGER)" }, { "DROP TABLE x" });
        later.depends_on = { "002" };
        records.push_back(later);
        CHECK_THROWS_AS(gen.squash(records, "", "003", scratch), SquashError);
        // depending on the boundary version is fine
        records.back().depends_on = { "003" };
        CHECK_NOTHROW(gen.squash(records, "", "003", scratch));
    }
    SECTION("no net effect") {
        records.push_back(make_sql_migration("004", { "ALTER TABLE tags ADD COLUMN note TEXT" },
            { "ALTER TABLE tags DROP COLUMN note" }));
        records.push_back(make_sql_migration("005", { "ALTER TABLE tags DROP COLUMN note" },
            { "ALTER TABLE tags ADD COLUMN note TEXT" }));
        CHECK_THROWS_AS(gen.squash(records, "004", "005", scratch), SquashError);
    }
}

TEST_CASE("Squashing executed migrations collapses the ledger", "[squash][executor]") {
    TempDir dir;
    MigrationStore store(dir.file("migrations"));
    for (const auto& r : history()) store.save(r);

    DbPool db(1, dir.file("app.db"), scratch);
    MigrationGenerator gen;

    SECTION("fully executed range") {
        MigrationExecutor exec(db, nullptr, store.load_all());
        exec.migrate();
        SchemaSnapshot migrated = pool::with_conn(db, pool::DbIntent::Read,
            [](SQLConnection& conn) { return SchemaIntrospector(conn, { LEDGER_TABLE }).snapshot(); });

        exec.squash("002", "003", store, gen, scratch);
        CHECK(versions_of(exec.records()) == StrList { "001", "003" });
        CHECK(versions_of(store.load_all()) == StrList { "001", "003" });
        CHECK(exec.pending().empty());

        auto ledger = pool::with_conn(db, pool::DbIntent::Read, [](SQLConnection& conn) {
            StrList out;
            for (const auto& e : MigrationLedger().successful(conn)) out.push_back(e.version);
            return out;
        });
        CHECK(ledger == StrList { "001", "003" });

        // a new database built from the squashed store matches
        DbPool other(1, dir.file("other.db"), scratch);
        MigrationExecutor fresh(other, nullptr, store.load_all());
        CHECK(fresh.migrate().executed == StrList { "001", "003" });
        SchemaSnapshot rebuilt = pool::with_conn(other, pool::DbIntent::Read,
            [](SQLConnection& conn) { return SchemaIntrospector(conn, { LEDGER_TABLE }).snapshot(); });
        CHECK(rebuilt == migrated);
    }
    SECTION("a failed ledger collapse leaves store and ledger alone") {
        MigrationExecutor exec(db, nullptr, store.load_all());
        exec.migrate();
        pool::with_conn(db, pool::DbIntent::Write, [](SQLConnection& conn) {
            conn.execute(std::string("CREATE TRIGGER keep_ledger BEFORE DELETE ON ") + LEDGER_TABLE
                + " BEGIN SELECT RAISE(ABORT, 'ledger locked'); END");
        });

        CHECK_THROWS(exec.squash("002", "003", store, gen, scratch));
        CHECK(versions_of(store.load_all()) == StrList { "001", "002", "003" });
        CHECK(store.load("003").squashed.empty());
        CHECK_FALSE(std::filesystem::exists(store.path_for("003") + ".tmp"));
        CHECK(versions_of(exec.records()) == StrList { "001", "002", "003" });
        CHECK(exec.pending().empty());

        auto ledger = pool::with_conn(db, pool::DbIntent::Read, [](SQLConnection& conn) {
            StrList out;
            for (const auto& e : MigrationLedger().successful(conn)) out.push_back(e.version);
            return out;
        });
        CHECK(ledger == StrList { "001", "002", "003" });
    }
    SECTION("range executed in part") {
        auto records = store.load_all();
        MigrationExecutor exec(db, nullptr, { records[0], records[1] });
        exec.migrate();
        exec.add(records[2]);
        CHECK_THROWS_AS(exec.squash("002", "003", store, gen, scratch), SquashError);
        CHECK(versions_of(store.load_all()) == StrList { "001", "002", "003" });
    }
    SECTION("range never executed") {
        MigrationExecutor exec(db, nullptr, store.load_all());
        exec.squash("", "002", store, gen, scratch);
        CHECK(exec.migrate().executed == StrList { "002", "003" });
    }
}
