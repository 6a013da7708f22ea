#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "jsonhlp.hpp"

/****************** LITERAL CONSTS */
#define KEY_TABLES      "tables"
#define KEY_NAME        "name"
#define KEY_COLUMNS     "columns"
#define KEY_TYPE        "type"
#define KEY_SIZE        "size"
#define KEY_SCALE       "scale"
#define KEY_NULLABLE    "nullable"
#define KEY_UNIQUE      "unique"
#define KEY_PRIMARY     "primary"
#define KEY_DEFAULT     "default"
#define KEY_REFERENCES  "references"
#define KEY_TABLE       "table"
#define KEY_COLUMN      "column"
#define KEY_ON_DELETE   "onDelete"
#define KEY_ON_UPDATE   "onUpdate"
#define KEY_INDEXES     "indexes"

#define FK_NO_ACTION    "NO ACTION"
#define ENUM_DEFAULT_SIZE 255

enum class SqlType {
    TinyInt, SmallInt, Integer, BigInt, Boolean,
    Decimal, Float, Double,
    Char, Varchar, Text, Blob,
    Date, Time, DateTime, Timestamp,
    Json, Enum, Relation
};
enum class TypeFamily { Integer, Decimal, Text, Temporal, Json };
enum class DefaultKind { None, String, Boolean, Number, Raw };

TypeFamily type_family(SqlType type);
// lower-case name used in entity files, e.g. "varchar"
std::string type_name(SqlType type);
SqlType sql_type_from_name(const std::string& name);

// Parses a declared SQL type such as "VARCHAR(255)" or "DECIMAL(10,2)".
// Unknown declarations fall back to Text following SQLite affinity rules.
void parse_declared_type(const std::string& declared, SqlType& type, int& size, int& scale);
// Classifies a default as reported by the catalog: 'quoted' text, a number, or a raw expression.
void parse_default_sql(const std::string& sql, DefaultKind& kind, std::string& value);

struct ForeignKeyRef {
    std::string table;
    std::string column;
    std::string on_delete = FK_NO_ACTION;
};

struct ColumnDefinition {
    std::string name;
    SqlType type = SqlType::Text;
    int size = 0; // length for Char/Varchar/Enum, precision for Decimal, 0 = none
    int scale = 0;
    bool nullable = true;
    bool unique = false;
    bool primary = false;
    std::optional<ForeignKeyRef> references;
    DefaultKind default_kind = DefaultKind::None;
    std::string default_value; // unquoted text for String defaults

    // physical form: Enum is a VARCHAR, Relation a BIGINT
    SqlType storage_type() const;
    int storage_size() const;
    // rendered SQL literal, empty when there is no default
    std::string default_sql() const;
    bool has_default() const { return default_kind != DefaultKind::None; }

    // everything but the name and the FK reference, which lives in the table FK list
    bool same_shape(const ColumnDefinition& o) const;
    bool operator==(const ColumnDefinition& o) const { return name == o.name && same_shape(o); }
};

struct IndexDefinition {
    std::string name;
    StrList columns;
    bool unique = false;

    // names are ignored
    bool same_structure(const IndexDefinition& o) const { return columns == o.columns && unique == o.unique; }
};

struct ForeignKeyDefinition {
    std::string name;
    std::string column;
    std::string ref_table;
    std::string ref_column;
    std::string on_delete = FK_NO_ACTION;
    std::string on_update = FK_NO_ACTION;

    bool same_structure(const ForeignKeyDefinition& o) const {
        return column == o.column && ref_table == o.ref_table && ref_column == o.ref_column
            && on_delete == o.on_delete && on_update == o.on_update;
    }
};

class TableSnapshot {
public:
    std::string name;
    std::vector<ColumnDefinition> columns;
    std::vector<IndexDefinition> indexes;
    std::vector<ForeignKeyDefinition> foreign_keys;

    const ColumnDefinition* column(const std::string& col) const;
    ColumnDefinition* column(const std::string& col);
    int position(const std::string& col) const; // -1 when absent
    StrList column_names() const;
    StrList primary_key() const;

    const IndexDefinition* find_index(const IndexDefinition& idx) const;
    const ForeignKeyDefinition* find_foreign_key(const ForeignKeyDefinition& fk) const;

    // throws MalformedSnapshotError on duplicate or invalid names
    void validate() const;

    // structural equality, column order is ignored
    bool operator==(const TableSnapshot& o) const;
    bool operator!=(const TableSnapshot& o) const { return !(*this == o); }
};

class SchemaSnapshot {
public:
    std::map<std::string, TableSnapshot> tables;

    const TableSnapshot* table(const std::string& name) const;
    TableSnapshot* table(const std::string& name);
    void add(TableSnapshot table);
    void validate() const;
    bool empty() const { return tables.empty(); }

    bool operator==(const SchemaSnapshot& o) const;
    bool operator!=(const SchemaSnapshot& o) const { return !(*this == o); }

    // entity file: {"tables":[{name, columns[], indexes[]}]}
    static SchemaSnapshot from_json(const jval& doc);
    static SchemaSnapshot load(const std::string& path);
    // human-readable listing for make:migration and tests
    std::string describe() const;
};

// Fluent declaration of a table. Column modifiers apply to the last declared column.
class TableBuilder {
public:
    explicit TableBuilder(std::string name);

    TableBuilder& column(const std::string& name, SqlType type, int size = 0, int scale = 0);
    TableBuilder& integer(const std::string& name) { return column(name, SqlType::Integer); }
    TableBuilder& bigint(const std::string& name) { return column(name, SqlType::BigInt); }
    TableBuilder& boolean(const std::string& name) { return column(name, SqlType::Boolean); }
    TableBuilder& varchar(const std::string& name, int size) { return column(name, SqlType::Varchar, size); }
    TableBuilder& text(const std::string& name) { return column(name, SqlType::Text); }
    TableBuilder& decimal(const std::string& name, int precision, int scale) { return column(name, SqlType::Decimal, precision, scale); }
    TableBuilder& datetime(const std::string& name) { return column(name, SqlType::DateTime); }

    TableBuilder& primary();
    TableBuilder& not_null();
    TableBuilder& unique();
    TableBuilder& default_str(const std::string& value);
    TableBuilder& default_num(const std::string& value);
    TableBuilder& default_bool(bool value);
    TableBuilder& default_raw(const std::string& expr);
    TableBuilder& references(const std::string& table, const std::string& column,
        const std::string& on_delete = FK_NO_ACTION);

    TableBuilder& index(const std::string& name, const StrList& columns, bool unique = false);

    TableSnapshot build() const;

private:
    ColumnDefinition& last();
    TableSnapshot table_;
};
