#include "ddl_visitor.hpp"
#include <algorithm>

#define REBUILD_SUFFIX "__rebuild"

std::string DDLVisitor::sql_default(const ColumnDefinition& c) {
    if (!c.has_default()) return "";
    return " DEFAULT " + c.default_sql();
}

std::string DDLVisitor::column_def(const ColumnDefinition& c) {
    std::string out = c.name + " " + sql_type(c);
    if (!c.nullable) out += " NOT NULL";
    if (c.unique) out += " UNIQUE";
    out += sql_default(c);
    return out;
}

std::string DDLVisitor::create_index(const std::string& table, const IndexDefinition& idx) {
    std::ostringstream ddl;
    ddl << "CREATE ";
    if (idx.unique) ddl << "UNIQUE ";
    ddl << "INDEX " << idx.name << " ON " << table << " (" << join(idx.columns, ", ") << ")";
    return ddl.str();
}

/* ---------- SQLite ---------- */

std::string SqliteDDLVisitor::sql_type(const ColumnDefinition& c) {
    int size = c.storage_size();
    switch (c.storage_type()) {
    case SqlType::TinyInt:   return "TINYINT";
    case SqlType::SmallInt:  return "SMALLINT";
    case SqlType::Integer:   return "INTEGER";
    case SqlType::BigInt:    return "BIGINT";
    case SqlType::Boolean:   return "BOOLEAN";
    case SqlType::Decimal:
        if (!size) return "DECIMAL";
        return "DECIMAL(" + std::to_string(size) + (c.scale ? "," + std::to_string(c.scale) : "") + ")";
    case SqlType::Float:     return "FLOAT";
    case SqlType::Double:    return "DOUBLE";
    case SqlType::Char:      return size ? "CHAR(" + std::to_string(size) + ")" : "CHAR";
    case SqlType::Varchar:   return size ? "VARCHAR(" + std::to_string(size) + ")" : "VARCHAR";
    case SqlType::Text:      return "TEXT";
    case SqlType::Blob:      return "BLOB";
    case SqlType::Date:      return "DATE";
    case SqlType::Time:      return "TIME";
    case SqlType::DateTime:  return "DATETIME";
    case SqlType::Timestamp: return "TIMESTAMP";
    case SqlType::Json:      return "JSON";
    default:                 return "TEXT";
    }
}

std::string SqliteDDLVisitor::create_table_stmt(const TableSnapshot& table, const std::string& name) {
    std::ostringstream ddl;
    ddl << "CREATE TABLE " << name << " (\n";
    StrList parts;
    for (const auto& c : table.columns) parts.push_back("  " + column_def(c));

    StrList pk = table.primary_key();
    if (!pk.empty()) parts.push_back("  PRIMARY KEY (" + join(pk, ", ") + ")");

    for (const auto& fk : table.foreign_keys) {
        std::string line = "  FOREIGN KEY (" + fk.column + ") REFERENCES " + fk.ref_table + " (" + fk.ref_column + ")";
        if (fk.on_delete != FK_NO_ACTION) line += " ON DELETE " + fk.on_delete;
        if (fk.on_update != FK_NO_ACTION) line += " ON UPDATE " + fk.on_update;
        parts.push_back(line);
    }
    ddl << join(parts, ",\n") << "\n)";
    return ddl.str();
}

StrList SqliteDDLVisitor::create_table(const TableSnapshot& table) {
    StrList out { create_table_stmt(table, table.name) };
    for (const auto& idx : table.indexes) out.push_back(create_index(table.name, idx));
    return out;
}

StrList SqliteDDLVisitor::rebuild(const TableSnapshot& current, const TableSnapshot& target) {
    const std::string tmp = target.name + REBUILD_SUFFIX;
    StrList common;
    for (const auto& c : target.columns) {
        if (current.column(c.name)) common.push_back(c.name);
    }
    std::string cols = join(common, ", ");

    StrList out;
    out.push_back(create_table_stmt(target, tmp));
    if (!common.empty()) {
        out.push_back("INSERT INTO " + tmp + " (" + cols + ") SELECT " + cols + " FROM " + current.name);
    }
    out.push_back("DROP TABLE " + current.name);
    out.push_back("ALTER TABLE " + tmp + " RENAME TO " + target.name);
    for (const auto& idx : target.indexes) out.push_back(create_index(target.name, idx));
    return out;
}

// ADD COLUMN rejects UNIQUE, PRIMARY KEY and non-constant defaults
bool SqliteDDLVisitor::add_needs_rebuild(const ColumnDefinition& c) const {
    if (c.unique || c.primary) return true;
    return c.default_kind == DefaultKind::Raw && to_upper(c.default_value) != "NULL";
}

// DROP COLUMN rejects key, unique, indexed and foreign-key columns
bool SqliteDDLVisitor::drop_needs_rebuild(const TableSnapshot& t, const ColumnDefinition& c) const {
    if (c.unique || c.primary) return true;
    for (const auto& fk : t.foreign_keys) {
        if (fk.column == c.name) return true;
    }
    for (const auto& idx : t.indexes) {
        if (std::find(idx.columns.begin(), idx.columns.end(), c.name) != idx.columns.end()) return true;
    }
    return false;
}

StrList SqliteDDLVisitor::visit(const DiffOp& op, const SchemaSnapshot& working) {
    // the table as it will look once the op has run
    auto target = [&]() {
        SchemaSnapshot next = working;
        apply_op(next, op);
        return *next.table(op.table);
    };
    auto current = [&]() -> const TableSnapshot& {
        const TableSnapshot* t = working.table(op.table);
        if (!t) THROW("unknown table '%s'", op.table.c_str());
        return *t;
    };

    switch (op.kind) {
    case OpKind::CreateTable:
        return create_table(*op.table_def);
    case OpKind::DropTable:
        return { "DROP TABLE " + op.table };
    case OpKind::AddColumn:
        if (add_needs_rebuild(*op.after)) return rebuild(current(), target());
        return { "ALTER TABLE " + op.table + " ADD COLUMN " + column_def(*op.after) };
    case OpKind::DropColumn: {
        const ColumnDefinition* col = current().column(op.before->name);
        if (!col) THROW("unknown column '%s.%s'", op.table.c_str(), op.before->name.c_str());
        if (drop_needs_rebuild(current(), *col)) return rebuild(current(), target());
        return { "ALTER TABLE " + op.table + " DROP COLUMN " + op.before->name };
    }
    case OpKind::ModifyColumn:
    case OpKind::AddForeignKey:
    case OpKind::DropForeignKey:
        return rebuild(current(), target());
    case OpKind::RenameColumn:
        return { "ALTER TABLE " + op.table + " RENAME COLUMN " + op.before->name + " TO " + op.after->name };
    case OpKind::AddIndex:
        return { create_index(op.table, *op.index) };
    case OpKind::DropIndex:
        return { "DROP INDEX " + op.index->name };
    case OpKind::RenameCandidate:
        THROW_AS(DiffAmbiguityError, "cannot render unresolved rename candidate " + op.describe());
    }
    return {};
}
