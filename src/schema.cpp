#include "schema.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

TypeFamily type_family(SqlType type) {
    switch (type) {
    case SqlType::TinyInt:
    case SqlType::SmallInt:
    case SqlType::Integer:
    case SqlType::BigInt:
    case SqlType::Boolean:
    case SqlType::Relation:
        return TypeFamily::Integer;
    case SqlType::Decimal:
    case SqlType::Float:
    case SqlType::Double:
        return TypeFamily::Decimal;
    case SqlType::Char:
    case SqlType::Varchar:
    case SqlType::Text:
    case SqlType::Blob:
    case SqlType::Enum:
        return TypeFamily::Text;
    case SqlType::Date:
    case SqlType::Time:
    case SqlType::DateTime:
    case SqlType::Timestamp:
        return TypeFamily::Temporal;
    case SqlType::Json:
        return TypeFamily::Json;
    }
    return TypeFamily::Text;
}

std::string type_name(SqlType type) {
    switch (type) {
    case SqlType::TinyInt:   return "tinyint";
    case SqlType::SmallInt:  return "smallint";
    case SqlType::Integer:   return "integer";
    case SqlType::BigInt:    return "bigint";
    case SqlType::Boolean:   return "boolean";
    case SqlType::Decimal:   return "decimal";
    case SqlType::Float:     return "float";
    case SqlType::Double:    return "double";
    case SqlType::Char:      return "char";
    case SqlType::Varchar:   return "varchar";
    case SqlType::Text:      return "text";
    case SqlType::Blob:      return "blob";
    case SqlType::Date:      return "date";
    case SqlType::Time:      return "time";
    case SqlType::DateTime:  return "datetime";
    case SqlType::Timestamp: return "timestamp";
    case SqlType::Json:      return "json";
    case SqlType::Enum:      return "enum";
    case SqlType::Relation:  return "relation";
    }
    return "text";
}

SqlType sql_type_from_name(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "tinyint"  ) return SqlType::TinyInt;
    if (n == "smallint" ) return SqlType::SmallInt;
    if (n == "integer" || n == "int") return SqlType::Integer;
    if (n == "bigint"   ) return SqlType::BigInt;
    if (n == "boolean" || n == "bool") return SqlType::Boolean;
    if (n == "decimal" || n == "numeric") return SqlType::Decimal;
    if (n == "float" || n == "real") return SqlType::Float;
    if (n == "double"   ) return SqlType::Double;
    if (n == "char"     ) return SqlType::Char;
    if (n == "varchar" || n == "string") return SqlType::Varchar;
    if (n == "text"     ) return SqlType::Text;
    if (n == "blob" || n == "binary") return SqlType::Blob;
    if (n == "date"     ) return SqlType::Date;
    if (n == "time"     ) return SqlType::Time;
    if (n == "datetime" ) return SqlType::DateTime;
    if (n == "timestamp") return SqlType::Timestamp;
    if (n == "json"     ) return SqlType::Json;
    if (n == "enum"     ) return SqlType::Enum;
    if (n == "relation" ) return SqlType::Relation;
    THROW_AS(MalformedSnapshotError, "invalid column type name: " + name);
}

void parse_declared_type(const std::string& declared, SqlType& type, int& size, int& scale) {
    std::string d = to_upper(trim(declared));
    size = 0;
    scale = 0;
    std::string base = d;
    auto open = d.find('(');
    if (open != std::string::npos) {
        base = trim(d.substr(0, open));
        auto close = d.find(')', open);
        std::string args = d.substr(open + 1, close == std::string::npos ? std::string::npos : close - open - 1);
        auto comma = args.find(',');
        try {
            size = std::stoi(args.substr(0, comma));
            if (comma != std::string::npos) scale = std::stoi(args.substr(comma + 1));
        } catch (const std::exception&) {
            size = 0;
            scale = 0;
        }
    }

    if      (base == "TINYINT"  ) type = SqlType::TinyInt;
    else if (base == "SMALLINT" ) type = SqlType::SmallInt;
    else if (base == "INTEGER" || base == "INT") type = SqlType::Integer;
    else if (base == "BIGINT"   ) type = SqlType::BigInt;
    else if (base == "BOOLEAN" || base == "BOOL") type = SqlType::Boolean;
    else if (base == "DECIMAL" || base == "NUMERIC") type = SqlType::Decimal;
    else if (base == "FLOAT" || base == "REAL") type = SqlType::Float;
    else if (base == "DOUBLE" || base == "DOUBLE PRECISION") type = SqlType::Double;
    else if (base == "CHAR"     ) type = SqlType::Char;
    else if (base == "VARCHAR"  ) type = SqlType::Varchar;
    else if (base == "TEXT"     ) type = SqlType::Text;
    else if (base == "BLOB"     ) type = SqlType::Blob;
    else if (base == "DATE"     ) type = SqlType::Date;
    else if (base == "TIME"     ) type = SqlType::Time;
    else if (base == "DATETIME" ) type = SqlType::DateTime;
    else if (base == "TIMESTAMP") type = SqlType::Timestamp;
    else if (base == "JSON"     ) type = SqlType::Json;
    // SQLite affinity rules for anything else
    else if (base.find("INT") != std::string::npos) type = SqlType::Integer;
    else if (base.find("CHAR") != std::string::npos || base.find("CLOB") != std::string::npos
        || base.find("TEXT") != std::string::npos) type = SqlType::Text;
    else if (base.empty() || base.find("BLOB") != std::string::npos) type = SqlType::Blob;
    else if (base.find("REAL") != std::string::npos || base.find("FLOA") != std::string::npos
        || base.find("DOUB") != std::string::npos) type = SqlType::Double;
    else type = SqlType::Decimal;
}

static bool is_number_literal(const std::string& s) {
    if (s.empty()) return false;
    size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    bool digits = false, dot = false;
    for (; i < s.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(s[i]))) digits = true;
        else if (s[i] == '.' && !dot) dot = true;
        else return false;
    }
    return digits;
}

void parse_default_sql(const std::string& sql, DefaultKind& kind, std::string& value) {
    std::string s = trim(sql);
    if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'') {
        kind = DefaultKind::String;
        value.clear();
        for (size_t i = 1; i + 1 < s.size(); ++i) {
            value += s[i];
            if (s[i] == '\'' && s[i + 1] == '\'') ++i;
        }
        return;
    }
    kind = is_number_literal(s) ? DefaultKind::Number : DefaultKind::Raw;
    value = s;
}

static std::string escape_quotes(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 4);
    for (char c : s) out += (c == '\'') ? "''" : std::string(1, c);
    return out;
}

/* ---------- ColumnDefinition ---------- */

SqlType ColumnDefinition::storage_type() const {
    if (type == SqlType::Enum) return SqlType::Varchar;
    if (type == SqlType::Relation) return SqlType::BigInt;
    return type;
}

int ColumnDefinition::storage_size() const {
    switch (storage_type()) {
    case SqlType::Varchar:
        if (type == SqlType::Enum && size == 0) return ENUM_DEFAULT_SIZE;
        return size;
    case SqlType::Char:
    case SqlType::Decimal:
        return size;
    default:
        return 0;
    }
}

std::string ColumnDefinition::default_sql() const {
    switch (default_kind) {
    case DefaultKind::None:
        return "";
    case DefaultKind::String:
        return "'" + escape_quotes(default_value) + "'";
    case DefaultKind::Boolean:
    case DefaultKind::Number:
    case DefaultKind::Raw:
        return default_value;
    }
    return "";
}

bool ColumnDefinition::same_shape(const ColumnDefinition& o) const {
    if (storage_type() != o.storage_type()) return false;
    if (storage_size() != o.storage_size()) return false;
    if (storage_type() == SqlType::Decimal && scale != o.scale) return false;
    return nullable == o.nullable && unique == o.unique && primary == o.primary
        && default_sql() == o.default_sql();
}

/* ---------- TableSnapshot ---------- */

const ColumnDefinition* TableSnapshot::column(const std::string& col) const {
    for (const auto& c : columns) {
        if (c.name == col) return &c;
    }
    return nullptr;
}

ColumnDefinition* TableSnapshot::column(const std::string& col) {
    for (auto& c : columns) {
        if (c.name == col) return &c;
    }
    return nullptr;
}

int TableSnapshot::position(const std::string& col) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name == col) return static_cast<int>(i);
    }
    return -1;
}

StrList TableSnapshot::column_names() const {
    StrList out;
    for (const auto& c : columns) out.push_back(c.name);
    return out;
}

StrList TableSnapshot::primary_key() const {
    StrList out;
    for (const auto& c : columns) {
        if (c.primary) out.push_back(c.name);
    }
    return out;
}

const IndexDefinition* TableSnapshot::find_index(const IndexDefinition& idx) const {
    for (const auto& i : indexes) {
        if (i.same_structure(idx)) return &i;
    }
    return nullptr;
}

const ForeignKeyDefinition* TableSnapshot::find_foreign_key(const ForeignKeyDefinition& fk) const {
    for (const auto& f : foreign_keys) {
        if (f.same_structure(fk)) return &f;
    }
    return nullptr;
}

void TableSnapshot::validate() const {
    if (!is_identifier(name)) THROW_AS(MalformedSnapshotError, "invalid table name '" + name + "'");
    if (columns.empty()) THROW_AS(MalformedSnapshotError, "table '" + name + "' has no columns");

    std::set<std::string> seen;
    for (const auto& c : columns) {
        if (!is_identifier(c.name)) {
            THROW_AS(MalformedSnapshotError, "invalid column name '" + c.name + "' in table '" + name + "'");
        }
        if (!seen.insert(c.name).second) {
            THROW_AS(MalformedSnapshotError, "duplicate column '" + c.name + "' in table '" + name + "'");
        }
    }
    std::set<std::string> index_names;
    for (const auto& idx : indexes) {
        if (!is_identifier(idx.name)) THROW_AS(MalformedSnapshotError, "invalid index name '" + idx.name + "'");
        if (!index_names.insert(idx.name).second) {
            THROW_AS(MalformedSnapshotError, "duplicate index '" + idx.name + "' on table '" + name + "'");
        }
        if (idx.columns.empty()) THROW_AS(MalformedSnapshotError, "index '" + idx.name + "' has no columns");
        for (const auto& col : idx.columns) {
            if (!seen.count(col)) {
                THROW_AS(MalformedSnapshotError, "index '" + idx.name + "' names unknown column '" + col + "'");
            }
        }
    }
    for (const auto& fk : foreign_keys) {
        if (!seen.count(fk.column)) {
            THROW_AS(MalformedSnapshotError, "foreign key on unknown column '" + fk.column + "' in table '" + name + "'");
        }
        if (!is_identifier(fk.ref_table) || !is_identifier(fk.ref_column)) {
            THROW_AS(MalformedSnapshotError, "invalid foreign key target on '" + name + "." + fk.column + "'");
        }
    }
}

bool TableSnapshot::operator==(const TableSnapshot& o) const {
    if (name != o.name || columns.size() != o.columns.size()) return false;
    for (const auto& c : columns) {
        const ColumnDefinition* other = o.column(c.name);
        if (!other || !c.same_shape(*other)) return false;
    }
    if (indexes.size() != o.indexes.size() || foreign_keys.size() != o.foreign_keys.size()) return false;
    for (const auto& idx : indexes) {
        if (!o.find_index(idx)) return false;
    }
    for (const auto& fk : foreign_keys) {
        if (!o.find_foreign_key(fk)) return false;
    }
    return true;
}

/* ---------- SchemaSnapshot ---------- */

const TableSnapshot* SchemaSnapshot::table(const std::string& name) const {
    auto it = tables.find(name);
    return it == tables.end() ? nullptr : &it->second;
}

TableSnapshot* SchemaSnapshot::table(const std::string& name) {
    auto it = tables.find(name);
    return it == tables.end() ? nullptr : &it->second;
}

void SchemaSnapshot::add(TableSnapshot table) {
    std::string name = table.name;
    if (!tables.emplace(name, std::move(table)).second) {
        THROW_AS(MalformedSnapshotError, "duplicate table '" + name + "'");
    }
}

void SchemaSnapshot::validate() const {
    // index names share one namespace per database
    std::set<std::string> index_names;
    for (const auto& [name, t] : tables) {
        t.validate();
        for (const auto& idx : t.indexes) {
            if (!index_names.insert(idx.name).second) {
                THROW_AS(MalformedSnapshotError, "index name '" + idx.name + "' used by more than one table");
            }
        }
    }
}

bool SchemaSnapshot::operator==(const SchemaSnapshot& o) const {
    if (tables.size() != o.tables.size()) return false;
    for (const auto& [name, t] : tables) {
        const TableSnapshot* other = o.table(name);
        if (!other || *other != t) return false;
    }
    return true;
}

SchemaSnapshot SchemaSnapshot::from_json(const jval& doc) {
    if (!doc.IsObject() || !doc.HasMember(KEY_TABLES) || !doc[KEY_TABLES].IsArray()) {
        THROW_AS(MalformedSnapshotError, "entity definition must be an object with a 'tables' array");
    }
    SchemaSnapshot schema;
    for (const auto& jt : doc[KEY_TABLES].GetArray()) {
        TableBuilder tb(jhlp::get<std::string>(jt, KEY_NAME));
        if (!jt.HasMember(KEY_COLUMNS) || !jt[KEY_COLUMNS].IsArray()) {
            THROW_AS(MalformedSnapshotError, "table '" + jhlp::get<std::string>(jt, KEY_NAME) + "' has no 'columns' array");
        }
        for (const auto& jc : jt[KEY_COLUMNS].GetArray()) {
            tb.column(jhlp::get<std::string>(jc, KEY_NAME),
                sql_type_from_name(jhlp::get<std::string>(jc, KEY_TYPE, "text")),
                jhlp::get<int>(jc, KEY_SIZE, 0),
                jhlp::get<int>(jc, KEY_SCALE, 0));
            if (jhlp::get<bool>(jc, KEY_PRIMARY, false)) tb.primary();
            if (!jhlp::get<bool>(jc, KEY_NULLABLE, true)) tb.not_null();
            if (jhlp::get<bool>(jc, KEY_UNIQUE, false)) tb.unique();
            if (jc.HasMember(KEY_DEFAULT)) {
                const jval& def = jc[KEY_DEFAULT];
                if (def.IsString()) tb.default_str(def.GetString());
                else if (def.IsBool()) tb.default_bool(def.GetBool());
                else if (def.IsNumber()) tb.default_num(jhlp::val2str(def));
                else if (def.IsNull()) tb.default_raw("NULL");
                else THROW_AS(MalformedSnapshotError, "unsupported default for column '" + jhlp::get<std::string>(jc, KEY_NAME) + "'");
            }
            if (jc.HasMember(KEY_REFERENCES)) {
                const jval& ref = jc[KEY_REFERENCES];
                tb.references(jhlp::get<std::string>(ref, KEY_TABLE),
                    jhlp::get<std::string>(ref, KEY_COLUMN, "id"),
                    jhlp::get<std::string>(ref, KEY_ON_DELETE, FK_NO_ACTION));
            }
        }
        if (jt.HasMember(KEY_INDEXES) && jt[KEY_INDEXES].IsArray()) {
            for (const auto& ji : jt[KEY_INDEXES].GetArray()) {
                tb.index(jhlp::get<std::string>(ji, KEY_NAME),
                    jhlp::get_strings(ji, KEY_COLUMNS),
                    jhlp::get<bool>(ji, KEY_UNIQUE, false));
            }
        }
        schema.add(tb.build());
    }
    schema.validate();
    return schema;
}

SchemaSnapshot SchemaSnapshot::load(const std::string& path) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) {
        THROW_AS(MalformedSnapshotError, "cannot read entity definitions from '" + path + "'");
    }
    return from_json(doc);
}

std::string SchemaSnapshot::describe() const {
    std::ostringstream out;
    for (const auto& [name, t] : tables) {
        out << name << "\n";
        for (const auto& c : t.columns) {
            out << "  " << c.name << " " << type_name(c.type);
            if (c.size) out << "(" << c.size << (c.scale ? "," + std::to_string(c.scale) : "") << ")";
            if (c.primary) out << " pk";
            if (!c.nullable) out << " not null";
            if (c.unique) out << " unique";
            if (c.has_default()) out << " default " << c.default_sql();
            out << "\n";
        }
        for (const auto& idx : t.indexes) {
            out << "  index " << idx.name << (idx.unique ? " unique" : "") << " (" << join(idx.columns, ", ") << ")\n";
        }
        for (const auto& fk : t.foreign_keys) {
            out << "  fk " << fk.column << " -> " << fk.ref_table << "." << fk.ref_column
                << " on delete " << fk.on_delete << "\n";
        }
    }
    return out.str();
}

/* ---------- TableBuilder ---------- */

TableBuilder::TableBuilder(std::string name) {
    table_.name = std::move(name);
}

TableBuilder& TableBuilder::column(const std::string& name, SqlType type, int size, int scale) {
    ColumnDefinition c;
    c.name = name;
    c.type = type;
    c.size = size;
    c.scale = scale;
    table_.columns.push_back(std::move(c));
    return *this;
}

ColumnDefinition& TableBuilder::last() {
    if (table_.columns.empty()) THROW("TableBuilder '%s': modifier before any column", table_.name.c_str());
    return table_.columns.back();
}

TableBuilder& TableBuilder::primary() {
    last().primary = true;
    last().nullable = false;
    return *this;
}

TableBuilder& TableBuilder::not_null() {
    last().nullable = false;
    return *this;
}

TableBuilder& TableBuilder::unique() {
    last().unique = true;
    return *this;
}

TableBuilder& TableBuilder::default_str(const std::string& value) {
    last().default_kind = DefaultKind::String;
    last().default_value = value;
    return *this;
}

TableBuilder& TableBuilder::default_num(const std::string& value) {
    if (!is_number_literal(value)) THROW("TableBuilder: '%s' is not a number", value.c_str());
    last().default_kind = DefaultKind::Number;
    last().default_value = value;
    return *this;
}

TableBuilder& TableBuilder::default_bool(bool value) {
    last().default_kind = DefaultKind::Boolean;
    last().default_value = value ? "1" : "0";
    return *this;
}

TableBuilder& TableBuilder::default_raw(const std::string& expr) {
    last().default_kind = DefaultKind::Raw;
    last().default_value = expr;
    return *this;
}

TableBuilder& TableBuilder::references(const std::string& table, const std::string& column, const std::string& on_delete) {
    ColumnDefinition& c = last();
    std::string action = to_upper(trim(on_delete));
    c.references = ForeignKeyRef { table, column, action };
    ForeignKeyDefinition fk;
    fk.name = "fk_" + table_.name + "_" + c.name;
    fk.column = c.name;
    fk.ref_table = table;
    fk.ref_column = column;
    fk.on_delete = action;
    table_.foreign_keys.push_back(std::move(fk));
    return *this;
}

TableBuilder& TableBuilder::index(const std::string& name, const StrList& columns, bool unique) {
    table_.indexes.push_back(IndexDefinition { name, columns, unique });
    return *this;
}

TableSnapshot TableBuilder::build() const {
    table_.validate();
    return table_;
}
