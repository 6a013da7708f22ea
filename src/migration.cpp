#include "migration.hpp"
#include "log.hpp"
#include <cctype>

namespace {

const logging::Logger& exec_log() {
    static const logging::Logger log { logging::EXECUTOR_LOGGER };
    return log;
}

} // anonymous namespace

std::string SchemaExpectation::str() const {
    std::string out = present ? "" : "!";
    switch (kind) {
    case Kind::Table:  return out + "table:" + table;
    case Kind::Column: return out + "column:" + table + "." + name;
    case Kind::Index:  return out + "index:" + name;
    }
    return out;
}

SchemaExpectation SchemaExpectation::parse(const std::string& text) {
    SchemaExpectation e;
    std::string t = trim(text);
    if (!t.empty() && t[0] == '!') {
        e.present = false;
        t = t.substr(1);
    }
    auto colon = t.find(':');
    if (colon == std::string::npos) THROW("malformed schema expectation '%s'", text.c_str());
    std::string kind = t.substr(0, colon), target = t.substr(colon + 1);
    if (kind == "table") {
        e.kind = Kind::Table;
        e.table = target;
    } else if (kind == "column") {
        auto dot = target.find('.');
        if (dot == std::string::npos) THROW("malformed column expectation '%s'", text.c_str());
        e.kind = Kind::Column;
        e.table = target.substr(0, dot);
        e.name = target.substr(dot + 1);
    } else if (kind == "index") {
        e.kind = Kind::Index;
        e.name = target;
    } else {
        THROW("unknown schema expectation kind '%s'", kind.c_str());
    }
    return e;
}

std::string SchemaExpectation::check(const SchemaSnapshot& schema) const {
    bool found = false;
    switch (kind) {
    case Kind::Table:
        found = schema.table(table) != nullptr;
        break;
    case Kind::Column: {
        const TableSnapshot* t = schema.table(table);
        found = t && t->column(name);
        break;
    }
    case Kind::Index:
        for (const auto& [tname, t] : schema.tables) {
            for (const auto& idx : t.indexes) {
                if (idx.name == name) found = true;
            }
        }
        break;
    }
    if (found == present) return "";
    return (present ? "missing " : "unexpected ") + str().substr(present ? 0 : 1);
}

void run_statements(SQLConnection& conn, const StrList& statements) {
    for (const auto& sql : statements) {
        exec_log().debug("exec: {}", sql);
        conn.execute(sql);
    }
}

void bind_sql(MigrationRecord& record) {
    StrList up = record.up_sql, down = record.down_sql;
    std::vector<SchemaExpectation> expects = record.expects;
    record.up = [up](SQLConnection& conn) { run_statements(conn, up); };
    record.down = [down](SQLConnection& conn) { run_statements(conn, down); };
    record.dry_run = [up](SQLConnection&) { return up; };
    if (expects.empty()) {
        record.validate = nullptr;
        return;
    }
    record.validate = [expects](const SchemaSnapshot& schema) {
        StrList problems;
        for (const auto& e : expects) {
            std::string p = e.check(schema);
            if (!p.empty()) problems.push_back(p);
        }
        return problems;
    };
}

MigrationRecord make_sql_migration(const std::string& version, StrList up, StrList down, std::string description) {
    if (!is_valid_version(version)) THROW_AS(MigrationError, "invalid migration version '" + version + "'");
    MigrationRecord r;
    r.version = version;
    r.description = std::move(description);
    r.up_sql = std::move(up);
    r.down_sql = std::move(down);
    bind_sql(r);
    return r;
}

bool is_valid_version(const std::string& version) {
    if (version.empty()) return false;
    for (char c : version) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-')) return false;
    }
    return true;
}

std::string next_version(const std::string& newest_known) {
    std::string v = timestamp_ms();
    if (!newest_known.empty() && v <= newest_known) {
        int64_t last = parse_timestamp_ms(newest_known);
        if (last < 0) THROW_AS(MigrationError, "cannot derive a version after '" + newest_known + "'");
        v = timestamp_ms(last + 1);
    }
    return v;
}
