#include "catch2/catch.hpp"
#include "backup.hpp"
#include "fake_sql.hpp"
#include <fstream>

namespace {

constexpr int64_t DAY_MS = 24LL * 60 * 60 * 1000;

struct BackupFixture {
    BackupFixture()
        : db(1, dir.file("shop.db"), []() { return make_sqlite_connection(); })
        , backups(db, dir.file("backups")) {
        std::filesystem::create_directories(backups.dir());
    }

    // empty file carrying a backup name of the given age
    void touch(const std::string& version, int64_t created_at) {
        std::ofstream((std::filesystem::path(backups.dir()) / backups.file_name(version, created_at)).string());
    }

    long long count(const std::string& table) {
        return pool::with_conn(db, pool::DbIntent::Read, [&](SQLConnection& conn) {
            return std::stoll(*conn.query("SELECT COUNT(*) FROM " + table).at(0).at(0));
        });
    }

    TempDir dir;
    DbPool db;
    BackupManager backups;
};

} // anonymous namespace

TEST_CASE_METHOD(BackupFixture, "Cleanup deletes backups past the retention window", "[backup][scenario]") {
    const int64_t now = now_ms();
    touch("001", now - 10 * DAY_MS);
    touch("002", now - 40 * DAY_MS);
    touch("003", now - 90 * DAY_MS);
    REQUIRE(backups.list().size() == 3);

    CHECK(backups.cleanup(30, now) == 2);
    auto left = backups.list();
    REQUIRE(left.size() == 1);
    CHECK(left[0].version == "001");
}

TEST_CASE_METHOD(BackupFixture, "Retention of zero deletes everything, a long one nothing", "[backup]") {
    const int64_t now = now_ms();
    touch("001", now - 10 * DAY_MS);
    touch("", now - 40 * DAY_MS);

    CHECK(backups.cleanup(9999, now) == 0);
    CHECK(backups.list().size() == 2);
    CHECK(backups.cleanup(0, now) == 2);
    CHECK(backups.list().empty());
    CHECK_THROWS(backups.cleanup(-1, now));
}

TEST_CASE_METHOD(BackupFixture, "Backups restore the database they copied", "[backup]") {
    pool::with_conn(db, pool::DbIntent::Write, [](SQLConnection& conn) {
        conn.execute("CREATE TABLE items (id INTEGER)");
        conn.execute("INSERT INTO items VALUES (1), (2), (3)");
    });

    BackupFile b = backups.create("002");
    CHECK(b.version == "002");
    CHECK(b.database == "shop");
    CHECK(b.size > 0);
    CHECK(std::filesystem::exists(b.path));

    pool::with_conn(db, pool::DbIntent::Write, [](SQLConnection& conn) { conn.execute("DELETE FROM items"); });
    CHECK(count("items") == 0);

    BackupFile restored = backups.restore("002");
    CHECK(restored.id == b.id);
    CHECK(count("items") == 3);

    CHECK(backups.total_size() == b.size);
    CHECK_FALSE(backups.find("001"));
}

TEST_CASE_METHOD(BackupFixture, "Restore matches versions exactly", "[backup][error]") {
    const int64_t now = now_ms();
    touch("0010", now);
    CHECK_THROWS_AS(backups.restore("001"), BackupNotFoundError);
    CHECK_THROWS_AS(backups.restore("999"), BackupNotFoundError);
}

TEST_CASE_METHOD(BackupFixture, "Newest backups come first", "[backup]") {
    const int64_t now = now_ms();
    touch("001", now - 2 * DAY_MS);
    touch("001", now - DAY_MS);
    touch("002", now - 3 * DAY_MS);
    std::ofstream(dir.file("backups/unrelated.txt")) << "x";
    std::ofstream((std::filesystem::path(backups.dir()) / "backup_other__001__20240101000000000.db").string());

    auto all = backups.list();
    REQUIRE(all.size() == 3);
    CHECK(all[0].created_at == now - DAY_MS);
    CHECK(backups.find("001")->created_at == now - DAY_MS);
}

TEST_CASE("Backup names encode database, version and time", "[backup]") {
    auto b = BackupManager::parse_name("backup_shop__20240101-a__20231114221320123.db");
    REQUIRE(b);
    CHECK(b->database == "shop");
    CHECK(b->version == "20240101-a");
    CHECK(b->created_at == 1700000000123);

    auto untagged = BackupManager::parse_name("backup_shop__20231114221320123.db");
    REQUIRE(untagged);
    CHECK(untagged->version.empty());

    CHECK_FALSE(BackupManager::parse_name("backup_shop__001__yesterday.db"));
    CHECK_FALSE(BackupManager::parse_name("shop.db"));
    CHECK_FALSE(BackupManager::parse_name("backup_shop__20231114221320123.sql"));

    CHECK(BackupManager::format_size(512) == "512.00 B");
    CHECK(BackupManager::format_size(1536) == "1.50 KB");
    CHECK(BackupManager::format_size(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
}
