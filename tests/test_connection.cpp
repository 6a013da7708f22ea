#include "catch2/catch.hpp"
#include "fake_sql.hpp"
#include "migration.hpp"
#include "sqlconnection.hpp"

namespace {

long long count_rows(SQLConnection& conn, const std::string& table) {
    return std::stoll(*conn.query("SELECT COUNT(*) FROM " + table).at(0).at(0));
}

} // anonymous namespace

TEST_CASE("SQLite connection executes and queries", "[sqlite]") {
    TempDir dir;
    auto conn = make_sqlite_connection();
    conn->connect(dir.file("app.db"));
    REQUIRE(conn->is_open());
    CHECK(conn->dsn() == dir.file("app.db"));

    conn->execute("CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT, nick TEXT)");
    CHECK(conn->execute("INSERT INTO users (name, nick) VALUES ('ann', NULL), ('bob', 'b')") == 2);

    SqlRows rows = conn->query("SELECT name, nick FROM users WHERE name = ? ORDER BY id", { std::string("ann") });
    REQUIRE(rows.size() == 1);
    CHECK(rows[0][0] == SqlValue("ann"));
    CHECK_FALSE(rows[0][1].has_value());

    auto stmt = conn->prepare("UPDATE users SET nick = ? WHERE id = ?");
    stmt->bind_text(1, "anna");
    stmt->bind_int(2, 1);
    CHECK(stmt->exec() == 1);
    CHECK(conn->query("SELECT nick FROM users WHERE id = 1").at(0).at(0) == SqlValue("anna"));

    conn->disconnect();
    CHECK_FALSE(conn->is_open());
}

TEST_CASE("Rejected statements raise SqlError naming the statement", "[sqlite][error]") {
    auto conn = make_sqlite_connection();
    conn->connect(":memory:");
    try {
        conn->execute("ALTER TABLE missing ADD COLUMN x TEXT");
        FAIL("statement was accepted");
    } catch (const SqlError& e) {
        CHECK(e.statement() == "ALTER TABLE missing ADD COLUMN x TEXT");
        CHECK_THAT(e.what(), Catch::Contains("no such table"));
    }
    CHECK_THROWS_AS(conn->prepare("SELEC 1"), SqlError);
}

TEST_CASE("Transaction rolls back unless committed", "[sqlite][transaction]") {
    auto conn = make_sqlite_connection();
    conn->connect(":memory:");
    conn->execute("CREATE TABLE t (a INTEGER)");

    {
        Transaction tr(*conn);
        conn->execute("INSERT INTO t VALUES (1)");
        CHECK(conn->in_transaction());
    }
    CHECK_FALSE(conn->in_transaction());
    CHECK(count_rows(*conn, "t") == 0);

    {
        Transaction tr(*conn);
        conn->execute("INSERT INTO t VALUES (2)");
        tr.commit();
        CHECK_FALSE(tr.active());
    }
    CHECK(count_rows(*conn, "t") == 1);

    // DDL is transactional in SQLite
    {
        Transaction tr(*conn);
        conn->execute("CREATE TABLE u (b INTEGER)");
    }
    CHECK(conn->query("SELECT name FROM sqlite_master WHERE name = 'u'").empty());
}

TEST_CASE("run_statements stops at the first rejected statement", "[sqlite][migration]") {
    FakeSQLConnection conn;
    conn.fail_on = "broken";
    try {
        run_statements(conn, { "CREATE TABLE a (x INTEGER)", "broken statement", "CREATE TABLE b (x INTEGER)" });
        FAIL("no error");
    } catch (const SqlError& e) {
        CHECK(e.statement() == "broken statement");
    }
    CHECK(conn.executed == StrList { "CREATE TABLE a (x INTEGER)" });
}

TEST_CASE("Database copies round-trip through export and import", "[sqlite][backup]") {
    TempDir dir;
    auto conn = make_sqlite_connection();
    conn->connect(dir.file("app.db"));
    conn->execute("CREATE TABLE t (a INTEGER)");
    conn->execute("INSERT INTO t VALUES (1), (2)");

    conn->export_to(dir.file("copy.db"));
    conn->execute("DROP TABLE t");
    CHECK(conn->query("SELECT name FROM sqlite_master WHERE name = 't'").empty());

    conn->import_from(dir.file("copy.db"));
    CHECK(count_rows(*conn, "t") == 2);

    conn->begin();
    CHECK_THROWS(conn->import_from(dir.file("copy.db")));
    conn->rollback();
}
