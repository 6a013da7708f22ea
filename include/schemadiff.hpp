#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "schema.hpp"

// Declaration order is the canonical execution order of the groups:
// creates, column adds, modifies/renames, index/FK adds, then drops.
enum class OpKind {
    CreateTable,
    AddColumn,
    ModifyColumn,
    RenameCandidate,
    RenameColumn,
    AddIndex,
    AddForeignKey,
    DropForeignKey,
    DropIndex,
    DropColumn,
    DropTable
};

std::string op_kind_name(OpKind kind);

struct DiffOp {
    OpKind kind;
    std::string table;
    std::optional<TableSnapshot> table_def;      // CreateTable, DropTable
    std::optional<ColumnDefinition> before;      // ModifyColumn, DropColumn, renames (old)
    std::optional<ColumnDefinition> after;       // ModifyColumn, AddColumn, renames (new)
    std::optional<IndexDefinition> index;        // AddIndex, DropIndex
    std::optional<ForeignKeyDefinition> foreign_key;
    double similarity = 0;                       // RenameCandidate: name similarity in [0,1]
    std::string basis;                           // RenameCandidate: "position" or "name"

    bool destructive() const;
    // column, index or FK column name the op acts on; table name for table ops
    std::string object_name() const;
    // e.g. "AddColumn users.email"
    std::string describe() const;
};

class SchemaDiff {
public:
    std::vector<DiffOp> ops;

    bool empty() const { return ops.empty(); }
    size_t size() const { return ops.size(); }
    bool destructive() const;
    bool has_rename_candidates() const;
    std::vector<const DiffOp*> rename_candidates() const;
    StrList describe() const;

    // stable sort into canonical order
    void sort();
};

// Operator answers for rename candidates, keyed by table.from->to
class RenameDecisions {
public:
    void confirm(const std::string& table, const std::string& from, const std::string& to);
    void deny(const std::string& table, const std::string& from, const std::string& to);
    // answer used for candidates without an explicit decision
    void answer_all(bool confirm) { fallback_ = confirm; }

    std::optional<bool> lookup(const std::string& table, const std::string& from, const std::string& to) const;

private:
    static std::string key(const std::string& table, const std::string& from, const std::string& to);
    std::map<std::string, bool> decisions_;
    std::optional<bool> fallback_;
};

// 1 - levenshtein(a, b) / max(|a|, |b|), case-insensitive
double name_similarity(const std::string& a, const std::string& b);

// narrowed capacity or a type change that can drop information
bool is_lossy_change(const ColumnDefinition& before, const ColumnDefinition& after);

// Structural diff turning @p actual into @p desired. Throws MalformedSnapshotError only.
SchemaDiff diff(const SchemaSnapshot& desired, const SchemaSnapshot& actual);

// Replaces every RenameCandidate by a RenameColumn (confirmed) or DropColumn + AddColumn (denied).
// A candidate without a decision throws DiffAmbiguityError.
SchemaDiff resolve(const SchemaDiff& diff, const RenameDecisions& decisions);

// Advances @p schema by one operation
void apply_op(SchemaSnapshot& schema, const DiffOp& op);

// The operation undoing @p op
DiffOp invert(const DiffOp& op);
