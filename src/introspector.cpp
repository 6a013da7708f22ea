#include "introspector.hpp"
#include "log.hpp"
#include <map>

namespace {

const logging::Logger& diff_log() {
    static const logging::Logger log { logging::DIFF_LOGGER };
    return log;
}

const std::string& text(const SqlRow& row, size_t i) {
    static const std::string empty;
    return row[i] ? *row[i] : empty;
}

int num(const SqlRow& row, size_t i) {
    return row[i] ? std::stoi(*row[i]) : 0;
}

} // anonymous namespace

SchemaIntrospector::SchemaIntrospector(SQLConnection& conn, std::set<std::string> excluded)
    : conn_(conn)
    , excluded_(std::move(excluded)) { }

StrList SchemaIntrospector::table_names() {
    StrList names;
    auto rows = conn_.query(
        "SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' ORDER BY name");
    for (const auto& row : rows) {
        const std::string& name = text(row, 0);
        if (!excluded_.count(name)) names.push_back(name);
    }
    return names;
}

TableSnapshot SchemaIntrospector::table(const std::string& name) {
    TableSnapshot t;
    t.name = name;

    auto cols = conn_.query(
        "SELECT cid, name, type, \"notnull\", dflt_value, pk FROM pragma_table_info(?) ORDER BY cid", { name });
    if (cols.empty()) THROW("table '%s' does not exist", name.c_str());
    for (const auto& row : cols) {
        ColumnDefinition c;
        c.name = text(row, 1);
        parse_declared_type(text(row, 2), c.type, c.size, c.scale);
        c.nullable = num(row, 3) == 0;
        if (row[4]) parse_default_sql(*row[4], c.default_kind, c.default_value);
        c.primary = num(row, 5) > 0;
        t.columns.push_back(std::move(c));
    }

    // origin: 'c' CREATE INDEX, 'u' UNIQUE constraint, 'pk' PRIMARY KEY
    auto idx_rows = conn_.query(
        "SELECT name, \"unique\", origin FROM pragma_index_list(?) ORDER BY name", { name });
    for (const auto& row : idx_rows) {
        const std::string& idx_name = text(row, 0);
        const std::string& origin = text(row, 2);
        if (origin == "pk") continue;

        StrList idx_cols;
        for (const auto& ir : conn_.query("SELECT name FROM pragma_index_info(?) ORDER BY seqno", { idx_name })) {
            idx_cols.push_back(text(ir, 0));
        }
        if (origin == "u") {
            if (idx_cols.size() == 1 && t.column(idx_cols[0])) {
                t.column(idx_cols[0])->unique = true;
            } else {
                diff_log().warn("table '{}': multi-column UNIQUE constraint {} is not tracked", name, idx_name);
            }
            continue;
        }
        t.indexes.push_back(IndexDefinition { idx_name, idx_cols, num(row, 1) != 0 });
    }

    auto fk_rows = conn_.query(
        "SELECT id, seq, \"table\", \"from\", \"to\", on_update, on_delete FROM pragma_foreign_key_list(?) ORDER BY id, seq",
        { name });
    std::map<int, int> parts;
    for (const auto& row : fk_rows) parts[num(row, 0)]++;
    for (const auto& row : fk_rows) {
        if (parts[num(row, 0)] > 1) {
            if (num(row, 1) == 0) diff_log().warn("table '{}': composite foreign key is not tracked", name);
            continue;
        }
        ForeignKeyDefinition fk;
        fk.column = text(row, 3);
        fk.name = "fk_" + name + "_" + fk.column;
        fk.ref_table = text(row, 2);
        fk.ref_column = row[4] ? *row[4] : "id";
        fk.on_update = to_upper(text(row, 5));
        fk.on_delete = to_upper(text(row, 6));
        if (ColumnDefinition* c = t.column(fk.column)) {
            c->references = ForeignKeyRef { fk.ref_table, fk.ref_column, fk.on_delete };
        }
        t.foreign_keys.push_back(std::move(fk));
    }
    return t;
}

SchemaSnapshot SchemaIntrospector::snapshot() {
    SchemaSnapshot s;
    for (const auto& name : table_names()) s.add(table(name));
    return s;
}
