#include "ledger.hpp"
#include "log.hpp"

namespace {

const logging::Logger& ledger_log() {
    static const logging::Logger log { logging::LEDGER_LOGGER };
    return log;
}

const char* SELECT_ENTRIES =
    "SELECT version, executed_at, success, batch, seq, execution_ms, backup_path FROM " LEDGER_TABLE;

LedgerEntry to_entry(const SqlRow& row) {
    LedgerEntry e;
    e.version = row[0].value_or("");
    e.executed_at = row[1].value_or("");
    e.success = row[2].value_or("0") != "0";
    e.batch = std::stoi(row[3].value_or("0"));
    e.seq = std::stoll(row[4].value_or("0"));
    e.execution_ms = std::stoll(row[5].value_or("0"));
    e.backup_path = row[6].value_or("");
    return e;
}

} // anonymous namespace

void MigrationLedger::ensure(SQLConnection& conn) {
    conn.execute(
        "CREATE TABLE IF NOT EXISTS " LEDGER_TABLE " (\n"
        "  version TEXT PRIMARY KEY,\n"
        "  executed_at TEXT NOT NULL,\n"
        "  success INTEGER NOT NULL,\n"
        "  batch INTEGER NOT NULL,\n"
        "  seq INTEGER NOT NULL,\n"
        "  execution_ms INTEGER NOT NULL DEFAULT 0,\n"
        "  backup_path TEXT\n"
        ")");
}

std::vector<LedgerEntry> MigrationLedger::entries(SQLConnection& conn) {
    std::vector<LedgerEntry> out;
    for (const auto& row : conn.query(std::string(SELECT_ENTRIES) + " ORDER BY seq, version")) {
        out.push_back(to_entry(row));
    }
    return out;
}

std::vector<LedgerEntry> MigrationLedger::successful(SQLConnection& conn) {
    std::vector<LedgerEntry> out;
    for (const auto& row : conn.query(std::string(SELECT_ENTRIES) + " WHERE success = 1 ORDER BY seq, version")) {
        out.push_back(to_entry(row));
    }
    return out;
}

std::optional<LedgerEntry> MigrationLedger::find(SQLConnection& conn, const std::string& version) {
    auto rows = conn.query(std::string(SELECT_ENTRIES) + " WHERE version = ?", { version });
    if (rows.empty()) return std::nullopt;
    return to_entry(rows.front());
}

int MigrationLedger::next_batch(SQLConnection& conn) {
    auto rows = conn.query("SELECT COALESCE(MAX(batch), 0) + 1 FROM " LEDGER_TABLE);
    return std::stoi(rows.at(0).at(0).value_or("1"));
}

int64_t MigrationLedger::next_seq(SQLConnection& conn) {
    auto rows = conn.query("SELECT COALESCE(MAX(seq), 0) + 1 FROM " LEDGER_TABLE);
    return std::stoll(rows.at(0).at(0).value_or("1"));
}

void MigrationLedger::record(SQLConnection& conn, LedgerEntry entry) {
    auto existing = find(conn, entry.version);
    if (existing && existing->success) {
        THROW_AS(LedgerError, "ledger already holds a successful entry for " + entry.version);
    }
    if (entry.seq == 0) entry.seq = next_seq(conn);
    if (entry.executed_at.empty()) entry.executed_at = iso_utc(now_ms());

    auto stmt = conn.prepare(
        "INSERT OR REPLACE INTO " LEDGER_TABLE
        " (version, executed_at, success, batch, seq, execution_ms, backup_path) VALUES (?, ?, ?, ?, ?, ?, ?)");
    stmt->bind_text(1, entry.version);
    stmt->bind_text(2, entry.executed_at);
    stmt->bind_int(3, entry.success ? 1 : 0);
    stmt->bind_int(4, entry.batch);
    stmt->bind_int(5, entry.seq);
    stmt->bind_int(6, entry.execution_ms);
    if (entry.backup_path.empty()) stmt->bind_null(7);
    else stmt->bind_text(7, entry.backup_path);
    stmt->exec();
    ledger_log().debug("ledger {} {} (batch {}, seq {})", entry.version, entry.success ? "ok" : "failed",
        entry.batch, entry.seq);
}

void MigrationLedger::remove(SQLConnection& conn, const std::string& version) {
    auto stmt = conn.prepare("DELETE FROM " LEDGER_TABLE " WHERE version = ?");
    stmt->bind_text(1, version);
    if (stmt->exec() != 1) THROW_AS(LedgerError, "no ledger entry for " + version);
}

void MigrationLedger::collapse(SQLConnection& conn, const StrList& versions, const std::string& baseline) {
    std::optional<LedgerEntry> last;
    for (const auto& v : versions) {
        auto e = find(conn, v);
        if (!e || !e->success) THROW_AS(LedgerError, "cannot collapse ledger: " + v + " has no successful entry");
        if (!last || e->seq > last->seq) last = e;
    }
    for (const auto& v : versions) remove(conn, v);

    LedgerEntry entry = *last;
    entry.version = baseline;
    entry.backup_path.clear();
    record(conn, entry);
    ledger_log().info("ledger: {} entries collapsed into {}", versions.size(), baseline);
}
