#include "catch2/catch.hpp"
#include "fake_sql.hpp"
#include "store.hpp"
#include <fstream>

namespace {

MigrationRecord sample(const std::string& version) {
    MigrationRecord r = make_sql_migration(version,
        { "CREATE TABLE t" + version + " (id INTEGER)" }, { "DROP TABLE t" + version }, "table " + version);
    r.depends_on = { "000" };
    r.expects = { SchemaExpectation::parse("!table:t" + version) };
    bind_sql(r);
    return r;
}

} // anonymous namespace

TEST_CASE("Stored migrations load back with their metadata", "[store]") {
    TempDir dir;
    MigrationStore store(dir.file("migrations"));

    MigrationRecord r = sample("001");
    r.is_destructive = true;
    r.requires_backup = true;
    r.can_run_in_parallel = true;
    r.conflicts_with = { "009" };
    std::string path = store.save(r);
    CHECK(path == store.path_for("001"));
    CHECK(store.exists("001"));

    MigrationRecord back = store.load("001");
    CHECK(back.version == "001");
    CHECK(back.description == "table 001");
    CHECK(back.is_destructive);
    CHECK(back.requires_backup);
    CHECK(back.can_run_in_parallel);
    CHECK(back.depends_on == std::set<std::string> { "000" });
    CHECK(back.conflicts_with == std::set<std::string> { "009" });
    CHECK(back.up_sql == r.up_sql);
    CHECK(back.down_sql == r.down_sql);
    REQUIRE(back.expects.size() == 1);
    CHECK(back.expects[0].str() == "!table:t001");

    // the loaded record is runnable
    FakeSQLConnection conn;
    back.up(conn);
    back.down(conn);
    CHECK(conn.executed == StrList { "CREATE TABLE t001 (id INTEGER)", "DROP TABLE t001" });
    REQUIRE(back.validate);
    CHECK(back.validate(SchemaSnapshot {}).empty());
}

TEST_CASE("Artifacts are listed by version and never overwritten", "[store]") {
    TempDir dir;
    MigrationStore store(dir.path());
    CHECK(store.load_all().empty());

    store.save(sample("003"));
    store.save(sample("001"));
    store.save(sample("002"));
    std::ofstream(dir.file("notes.txt")) << "ignored";

    std::vector<MigrationRecord> all = store.load_all();
    REQUIRE(all.size() == 3);
    CHECK(all[0].version == "001");
    CHECK(all[2].version == "003");

    CHECK_THROWS_AS(store.save(sample("002")), MigrationError);
    CHECK_THROWS_AS(store.load("042"), MigrationError);
}

TEST_CASE("Mismatched or broken artifacts are rejected", "[store][error]") {
    TempDir dir;
    MigrationStore store(dir.path());

    SECTION("file name disagrees with the version inside") {
        store.save(sample("001"));
        std::filesystem::rename(store.path_for("001"), store.path_for("002"));
        CHECK_THROWS_AS(store.load_all(), MigrationError);
    }
    SECTION("not JSON") {
        std::ofstream(store.path_for("001")) << "{ nope";
        CHECK_THROWS_AS(store.load("001"), MigrationError);
    }
    SECTION("record without SQL") {
        MigrationRecord r;
        r.version = "001";
        r.up = [](SQLConnection&) { };
        CHECK_THROWS_AS(store.save(r), MigrationError);
    }
}

TEST_CASE("Squashed artifacts are replaced by the baseline", "[store][squash]") {
    TempDir dir;
    MigrationStore store(dir.path());
    store.save(sample("001"));
    store.save(sample("002"));
    store.save(sample("003"));

    MigrationRecord baseline = make_sql_migration("002", { "CREATE TABLE t (id INTEGER)" }, { "DROP TABLE t" }, "squash");
    baseline.squashed = { "001", "002" };
    store.replace({ "001", "002" }, baseline);

    std::vector<MigrationRecord> all = store.load_all();
    REQUIRE(all.size() == 2);
    CHECK(all[0].version == "002");
    CHECK(all[0].squashed == StrList { "001", "002" });
    CHECK(all[0].description == "squash");
    CHECK(all[1].version == "003");
    CHECK_FALSE(store.exists("001"));
}
