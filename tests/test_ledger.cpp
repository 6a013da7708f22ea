#include "catch2/catch.hpp"
#include "ledger.hpp"

namespace {

struct LedgerFixture {
    LedgerFixture() {
        conn = make_sqlite_connection();
        conn->connect(":memory:");
        ledger.ensure(*conn);
    }

    void ok(const std::string& version, int batch) {
        LedgerEntry e;
        e.version = version;
        e.success = true;
        e.batch = batch;
        ledger.record(*conn, e);
    }

    PSQLConnection conn;
    MigrationLedger ledger;
};

StrList versions(const std::vector<LedgerEntry>& entries) {
    StrList out;
    for (const auto& e : entries) out.push_back(e.version);
    return out;
}

} // anonymous namespace

TEST_CASE_METHOD(LedgerFixture, "Ledger keeps entries in execution order", "[ledger]") {
    CHECK(ledger.next_batch(*conn) == 1);
    ok("002", 1);
    ok("001", 1);
    CHECK(ledger.next_batch(*conn) == 2);

    auto all = ledger.entries(*conn);
    CHECK(versions(all) == StrList { "002", "001" });
    CHECK(all[0].seq == 1);
    CHECK(all[1].seq == 2);
    CHECK(all[0].batch == 1);
    CHECK_FALSE(all[0].executed_at.empty());

    ledger.ensure(*conn); // idempotent
    CHECK(ledger.entries(*conn).size() == 2);
}

TEST_CASE_METHOD(LedgerFixture, "Failed entries are replaced, successful ones are not", "[ledger]") {
    LedgerEntry failed;
    failed.version = "001";
    failed.batch = 1;
    failed.execution_ms = 12;
    failed.backup_path = "/tmp/backup.db";
    ledger.record(*conn, failed);

    auto e = ledger.find(*conn, "001");
    REQUIRE(e);
    CHECK_FALSE(e->success);
    CHECK(e->execution_ms == 12);
    CHECK(e->backup_path == "/tmp/backup.db");
    CHECK(ledger.successful(*conn).empty());

    ok("001", 2);
    CHECK(versions(ledger.successful(*conn)) == StrList { "001" });
    CHECK(ledger.entries(*conn).size() == 1);
    CHECK_THROWS_AS(ok("001", 3), LedgerError);
    CHECK_FALSE(ledger.find(*conn, "999"));
}

TEST_CASE_METHOD(LedgerFixture, "Removing an entry leaves the others", "[ledger]") {
    ok("001", 1);
    ok("002", 2);
    ledger.remove(*conn, "002");
    CHECK(versions(ledger.entries(*conn)) == StrList { "001" });
    CHECK_THROWS_AS(ledger.remove(*conn, "002"), LedgerError);
}

TEST_CASE_METHOD(LedgerFixture, "Collapsing entries keeps the position of the newest", "[ledger][squash]") {
    ok("001", 1);
    ok("002", 1);
    ok("003", 2);
    ok("004", 3);

    ledger.collapse(*conn, { "001", "002", "003" }, "003");
    auto all = ledger.entries(*conn);
    REQUIRE(versions(all) == StrList { "003", "004" });
    CHECK(all[0].success);
    CHECK(all[0].batch == 2);
    CHECK(all[0].seq == 3);

    CHECK_THROWS_AS(ledger.collapse(*conn, { "003", "777" }, "003"), LedgerError);
}
