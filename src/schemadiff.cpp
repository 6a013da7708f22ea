#include "schemadiff.hpp"
#include "log.hpp"
#include <algorithm>
#include <set>

namespace {

const logging::Logger& diff_log() {
    static const logging::Logger log { logging::DIFF_LOGGER };
    return log;
}

constexpr double RENAME_SIMILARITY_THRESHOLD = 0.6;

int integer_rank(SqlType t) {
    switch (t) {
    case SqlType::Boolean:  return 0;
    case SqlType::TinyInt:  return 1;
    case SqlType::SmallInt: return 2;
    case SqlType::Integer:  return 3;
    default:                return 4; // BigInt, Relation
    }
}

DiffOp make_op(OpKind kind, const std::string& table) {
    DiffOp op;
    op.kind = kind;
    op.table = table;
    return op;
}

void rename_in(StrList& cols, const std::string& from, const std::string& to) {
    for (auto& c : cols) {
        if (c == from) c = to;
    }
}

TableSnapshot& require_table(SchemaSnapshot& schema, const std::string& name) {
    TableSnapshot* t = schema.table(name);
    if (!t) THROW("unknown table '%s'", name.c_str());
    return *t;
}

} // anonymous namespace

std::string op_kind_name(OpKind kind) {
    switch (kind) {
    case OpKind::CreateTable:     return "CreateTable";
    case OpKind::AddColumn:       return "AddColumn";
    case OpKind::ModifyColumn:    return "ModifyColumn";
    case OpKind::RenameCandidate: return "RenameCandidate";
    case OpKind::RenameColumn:    return "RenameColumn";
    case OpKind::AddIndex:        return "AddIndex";
    case OpKind::AddForeignKey:   return "AddForeignKey";
    case OpKind::DropForeignKey:  return "DropForeignKey";
    case OpKind::DropIndex:       return "DropIndex";
    case OpKind::DropColumn:      return "DropColumn";
    case OpKind::DropTable:       return "DropTable";
    }
    return "?";
}

/* ---------- DiffOp ---------- */

bool DiffOp::destructive() const {
    switch (kind) {
    case OpKind::DropTable:
    case OpKind::DropColumn:
        return true;
    case OpKind::ModifyColumn:
        return is_lossy_change(*before, *after);
    default:
        return false;
    }
}

std::string DiffOp::object_name() const {
    switch (kind) {
    case OpKind::CreateTable:
    case OpKind::DropTable:
        return table;
    case OpKind::AddColumn:
    case OpKind::ModifyColumn:
        return after->name;
    case OpKind::DropColumn:
    case OpKind::RenameCandidate:
    case OpKind::RenameColumn:
        return before->name;
    case OpKind::AddIndex:
    case OpKind::DropIndex:
        return index->name;
    case OpKind::AddForeignKey:
    case OpKind::DropForeignKey:
        return foreign_key->column;
    }
    return "";
}

std::string DiffOp::describe() const {
    std::string out = op_kind_name(kind) + " " + table;
    switch (kind) {
    case OpKind::CreateTable:
    case OpKind::DropTable:
        return out;
    case OpKind::RenameCandidate:
        return out + "." + before->name + " -> " + after->name + " (" + basis + ", similarity "
            + std::to_string(static_cast<int>(similarity * 100)) + "%)";
    case OpKind::RenameColumn:
        return out + "." + before->name + " -> " + after->name;
    case OpKind::AddForeignKey:
    case OpKind::DropForeignKey:
        return out + "." + foreign_key->column + " -> " + foreign_key->ref_table + "." + foreign_key->ref_column;
    default:
        return out + "." + object_name();
    }
}

/* ---------- SchemaDiff ---------- */

bool SchemaDiff::destructive() const {
    return std::any_of(ops.begin(), ops.end(), [](const DiffOp& op) { return op.destructive(); });
}

bool SchemaDiff::has_rename_candidates() const {
    return std::any_of(ops.begin(), ops.end(), [](const DiffOp& op) { return op.kind == OpKind::RenameCandidate; });
}

std::vector<const DiffOp*> SchemaDiff::rename_candidates() const {
    std::vector<const DiffOp*> out;
    for (const auto& op : ops) {
        if (op.kind == OpKind::RenameCandidate) out.push_back(&op);
    }
    return out;
}

StrList SchemaDiff::describe() const {
    StrList out;
    for (const auto& op : ops) out.push_back(op.describe());
    return out;
}

void SchemaDiff::sort() {
    // an index dropped to make room for a same-named replacement goes right before the add
    std::set<std::pair<std::string, std::string>> replaced;
    for (const auto& op : ops) {
        if (op.kind == OpKind::AddIndex) replaced.insert({ op.table, op.index->name });
    }
    auto rank = [&](const DiffOp& op) {
        int r = static_cast<int>(op.kind) * 2;
        if (op.kind == OpKind::DropIndex && replaced.count({ op.table, op.index->name })) {
            r = static_cast<int>(OpKind::AddIndex) * 2 - 1;
        }
        return r;
    };
    std::stable_sort(ops.begin(), ops.end(), [&](const DiffOp& a, const DiffOp& b) {
        int ra = rank(a), rb = rank(b);
        if (ra != rb) return ra < rb;
        if (a.table != b.table) return a.table < b.table;
        return a.object_name() < b.object_name();
    });
}

/* ---------- RenameDecisions ---------- */

std::string RenameDecisions::key(const std::string& table, const std::string& from, const std::string& to) {
    return table + "." + from + "->" + to;
}

void RenameDecisions::confirm(const std::string& table, const std::string& from, const std::string& to) {
    decisions_[key(table, from, to)] = true;
}

void RenameDecisions::deny(const std::string& table, const std::string& from, const std::string& to) {
    decisions_[key(table, from, to)] = false;
}

std::optional<bool> RenameDecisions::lookup(const std::string& table, const std::string& from, const std::string& to) const {
    auto it = decisions_.find(key(table, from, to));
    if (it != decisions_.end()) return it->second;
    return fallback_;
}

/* ---------- helpers ---------- */

double name_similarity(const std::string& a, const std::string& b) {
    std::string x = to_lower(a), y = to_lower(b);
    if (x.empty() && y.empty()) return 1.0;
    std::vector<size_t> prev(y.size() + 1), cur(y.size() + 1);
    for (size_t j = 0; j <= y.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= x.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= y.size(); ++j) {
            size_t cost = x[i - 1] == y[j - 1] ? 0 : 1;
            cur[j] = std::min({ prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost });
        }
        std::swap(prev, cur);
    }
    double dist = static_cast<double>(prev[y.size()]);
    return 1.0 - dist / static_cast<double>(std::max(x.size(), y.size()));
}

bool is_lossy_change(const ColumnDefinition& before, const ColumnDefinition& after) {
    SqlType from = before.storage_type(), to = after.storage_type();
    TypeFamily ff = type_family(from), tf = type_family(to);

    // anything but a blob fits an unbounded TEXT
    if (to == SqlType::Text) return from == SqlType::Blob;

    if (ff == TypeFamily::Integer && tf == TypeFamily::Integer) {
        return integer_rank(to) < integer_rank(from);
    }
    if (ff == TypeFamily::Integer && tf == TypeFamily::Decimal) return false;
    if (ff == TypeFamily::Decimal && tf == TypeFamily::Decimal) {
        if (from == SqlType::Float) return to == SqlType::Decimal;
        if (from == SqlType::Double) return to != SqlType::Double;
        // Decimal(p,s)
        if (to != SqlType::Decimal) return true;
        return after.storage_size() < before.storage_size() || after.scale < before.scale;
    }
    if (ff == TypeFamily::Text && tf == TypeFamily::Text) {
        if (from == SqlType::Blob || to == SqlType::Blob) return from != to;
        int old_cap = from == SqlType::Text ? 0 : before.storage_size();
        int new_cap = after.storage_size();
        if (new_cap == 0) return false;
        return old_cap == 0 || new_cap < old_cap;
    }
    if (ff == TypeFamily::Temporal && tf == TypeFamily::Temporal) {
        if (from == to) return false;
        if (from == SqlType::Date) return to == SqlType::Time;
        bool from_full = from == SqlType::DateTime || from == SqlType::Timestamp;
        bool to_full = to == SqlType::DateTime || to == SqlType::Timestamp;
        return !(from_full && to_full);
    }
    if (ff == TypeFamily::Json && tf == TypeFamily::Json) return false;
    return true;
}

/* ---------- diff ---------- */

static void diff_columns(const TableSnapshot& want, const TableSnapshot& have, SchemaDiff& out) {
    std::vector<const ColumnDefinition*> added, removed;
    for (const auto& c : want.columns) {
        const ColumnDefinition* old = have.column(c.name);
        if (!old) {
            added.push_back(&c);
        } else if (!old->same_shape(c)) {
            DiffOp op = make_op(OpKind::ModifyColumn, want.name);
            op.before = *old;
            op.after = c;
            out.ops.push_back(std::move(op));
        }
    }
    for (const auto& c : have.columns) {
        if (!want.column(c.name)) removed.push_back(&c);
    }

    struct Pair {
        const ColumnDefinition* from;
        const ColumnDefinition* to;
        double score;
        double similarity;
        bool same_position;
    };
    std::vector<Pair> pairs;
    for (const auto* r : removed) {
        for (const auto* a : added) {
            if (!r->same_shape(*a)) continue;
            bool same_pos = have.position(r->name) == want.position(a->name);
            double sim = name_similarity(r->name, a->name);
            if (!same_pos && sim < RENAME_SIMILARITY_THRESHOLD) continue;
            // type and constraints already match: 0.3 + 0.2
            double score = 0.5 * sim + 0.5 + (same_pos ? 0.01 : 0.0);
            pairs.push_back({ r, a, score, sim, same_pos });
        }
    }
    std::stable_sort(pairs.begin(), pairs.end(), [](const Pair& x, const Pair& y) { return x.score > y.score; });

    std::set<const ColumnDefinition*> paired;
    for (const auto& p : pairs) {
        if (paired.count(p.from) || paired.count(p.to)) continue;
        paired.insert(p.from);
        paired.insert(p.to);
        DiffOp op = make_op(OpKind::RenameCandidate, want.name);
        op.before = *p.from;
        op.after = *p.to;
        op.similarity = p.similarity;
        op.basis = p.same_position ? "position" : "name";
        diff_log().info("rename candidate {}.{} -> {} ({})", want.name, p.from->name, p.to->name, op.basis);
        out.ops.push_back(std::move(op));
    }
    for (const auto* a : added) {
        if (paired.count(a)) continue;
        DiffOp op = make_op(OpKind::AddColumn, want.name);
        op.after = *a;
        out.ops.push_back(std::move(op));
    }
    for (const auto* r : removed) {
        if (paired.count(r)) continue;
        DiffOp op = make_op(OpKind::DropColumn, want.name);
        op.before = *r;
        out.ops.push_back(std::move(op));
    }
}

static void diff_indexes(const TableSnapshot& want, const TableSnapshot& have, SchemaDiff& out) {
    for (const auto& idx : want.indexes) {
        if (have.find_index(idx)) continue;
        DiffOp op = make_op(OpKind::AddIndex, want.name);
        op.index = idx;
        out.ops.push_back(std::move(op));
    }
    for (const auto& idx : have.indexes) {
        if (want.find_index(idx)) continue;
        DiffOp op = make_op(OpKind::DropIndex, want.name);
        op.index = idx;
        out.ops.push_back(std::move(op));
    }
    for (const auto& fk : want.foreign_keys) {
        if (have.find_foreign_key(fk)) continue;
        DiffOp op = make_op(OpKind::AddForeignKey, want.name);
        op.foreign_key = fk;
        out.ops.push_back(std::move(op));
    }
    for (const auto& fk : have.foreign_keys) {
        if (want.find_foreign_key(fk)) continue;
        DiffOp op = make_op(OpKind::DropForeignKey, want.name);
        op.foreign_key = fk;
        out.ops.push_back(std::move(op));
    }
}

SchemaDiff diff(const SchemaSnapshot& desired, const SchemaSnapshot& actual) {
    desired.validate();
    actual.validate();

    SchemaDiff out;
    for (const auto& [name, want] : desired.tables) {
        const TableSnapshot* have = actual.table(name);
        if (!have) {
            DiffOp op = make_op(OpKind::CreateTable, name);
            op.table_def = want;
            out.ops.push_back(std::move(op));
            continue;
        }
        diff_columns(want, *have, out);
        diff_indexes(want, *have, out);
    }
    for (const auto& [name, have] : actual.tables) {
        if (desired.table(name)) continue;
        DiffOp op = make_op(OpKind::DropTable, name);
        op.table_def = have;
        out.ops.push_back(std::move(op));
    }
    out.sort();
    diff_log().debug("diff produced {} operation(s)", out.size());
    return out;
}

SchemaDiff resolve(const SchemaDiff& in, const RenameDecisions& decisions) {
    SchemaDiff out;
    struct Rename {
        std::string table, from, to;
    };
    std::vector<Rename> renames;

    for (const auto& op : in.ops) {
        if (op.kind != OpKind::RenameCandidate) {
            out.ops.push_back(op);
            continue;
        }
        auto answer = decisions.lookup(op.table, op.before->name, op.after->name);
        if (!answer) {
            THROW_AS(DiffAmbiguityError, "unresolved rename candidate " + op.table + "." + op.before->name
                    + " -> " + op.after->name + ": confirm or deny it");
        }
        if (*answer) {
            DiffOp r = op;
            r.kind = OpKind::RenameColumn;
            out.ops.push_back(std::move(r));
            renames.push_back({ op.table, op.before->name, op.after->name });
        } else {
            DiffOp add = make_op(OpKind::AddColumn, op.table);
            add.after = op.after;
            DiffOp drop = make_op(OpKind::DropColumn, op.table);
            drop.before = op.before;
            out.ops.push_back(std::move(add));
            out.ops.push_back(std::move(drop));
        }
    }

    // RENAME COLUMN rewrites indexes and foreign keys in place, so drop/add pairs
    // that only differ by the renamed column disappear
    for (const auto& rn : renames) {
        auto erase_pair = [&](OpKind drop_kind, OpKind add_kind, auto matches) {
            for (size_t i = 0; i < out.ops.size(); ++i) {
                if (out.ops[i].kind != drop_kind || out.ops[i].table != rn.table) continue;
                for (size_t j = 0; j < out.ops.size(); ++j) {
                    if (out.ops[j].kind != add_kind || out.ops[j].table != rn.table) continue;
                    if (!matches(out.ops[i], out.ops[j])) continue;
                    out.ops.erase(out.ops.begin() + std::max(i, j));
                    out.ops.erase(out.ops.begin() + std::min(i, j));
                    i = static_cast<size_t>(-1);
                    break;
                }
            }
        };
        erase_pair(OpKind::DropIndex, OpKind::AddIndex, [&](const DiffOp& d, const DiffOp& a) {
            IndexDefinition moved = *d.index;
            rename_in(moved.columns, rn.from, rn.to);
            return moved.name == a.index->name && moved.same_structure(*a.index);
        });
        erase_pair(OpKind::DropForeignKey, OpKind::AddForeignKey, [&](const DiffOp& d, const DiffOp& a) {
            ForeignKeyDefinition moved = *d.foreign_key;
            if (moved.column == rn.from) moved.column = rn.to;
            return moved.same_structure(*a.foreign_key);
        });
    }
    out.sort();
    return out;
}

/* ---------- operation algebra ---------- */

void apply_op(SchemaSnapshot& schema, const DiffOp& op) {
    switch (op.kind) {
    case OpKind::CreateTable:
        schema.add(*op.table_def);
        return;
    case OpKind::DropTable:
        if (!schema.tables.erase(op.table)) THROW("unknown table '%s'", op.table.c_str());
        return;
    case OpKind::AddColumn: {
        TableSnapshot& t = require_table(schema, op.table);
        if (t.column(op.after->name)) THROW("column '%s.%s' already exists", op.table.c_str(), op.after->name.c_str());
        t.columns.push_back(*op.after);
        return;
    }
    case OpKind::DropColumn: {
        TableSnapshot& t = require_table(schema, op.table);
        const std::string& col = op.before->name;
        int pos = t.position(col);
        if (pos < 0) THROW("unknown column '%s.%s'", op.table.c_str(), col.c_str());
        t.columns.erase(t.columns.begin() + pos);
        std::erase_if(t.indexes, [&](const IndexDefinition& i) {
            return std::find(i.columns.begin(), i.columns.end(), col) != i.columns.end();
        });
        std::erase_if(t.foreign_keys, [&](const ForeignKeyDefinition& f) { return f.column == col; });
        return;
    }
    case OpKind::ModifyColumn: {
        TableSnapshot& t = require_table(schema, op.table);
        ColumnDefinition* c = t.column(op.before->name);
        if (!c) THROW("unknown column '%s.%s'", op.table.c_str(), op.before->name.c_str());
        auto refs = c->references;
        *c = *op.after;
        c->references = refs;
        return;
    }
    case OpKind::RenameCandidate:
        THROW_AS(DiffAmbiguityError, "cannot apply unresolved rename candidate " + op.describe());
    case OpKind::RenameColumn: {
        TableSnapshot& t = require_table(schema, op.table);
        ColumnDefinition* c = t.column(op.before->name);
        if (!c) THROW("unknown column '%s.%s'", op.table.c_str(), op.before->name.c_str());
        c->name = op.after->name;
        for (auto& idx : t.indexes) rename_in(idx.columns, op.before->name, op.after->name);
        for (auto& fk : t.foreign_keys) {
            if (fk.column == op.before->name) fk.column = op.after->name;
        }
        return;
    }
    case OpKind::AddIndex:
        require_table(schema, op.table).indexes.push_back(*op.index);
        return;
    case OpKind::DropIndex: {
        TableSnapshot& t = require_table(schema, op.table);
        std::erase_if(t.indexes, [&](const IndexDefinition& i) { return i.name == op.index->name; });
        return;
    }
    case OpKind::AddForeignKey: {
        TableSnapshot& t = require_table(schema, op.table);
        t.foreign_keys.push_back(*op.foreign_key);
        if (ColumnDefinition* c = t.column(op.foreign_key->column)) {
            c->references = ForeignKeyRef { op.foreign_key->ref_table, op.foreign_key->ref_column, op.foreign_key->on_delete };
        }
        return;
    }
    case OpKind::DropForeignKey: {
        TableSnapshot& t = require_table(schema, op.table);
        std::erase_if(t.foreign_keys, [&](const ForeignKeyDefinition& f) { return f.same_structure(*op.foreign_key); });
        if (ColumnDefinition* c = t.column(op.foreign_key->column)) c->references.reset();
        return;
    }
    }
}

DiffOp invert(const DiffOp& op) {
    DiffOp r = op;
    switch (op.kind) {
    case OpKind::CreateTable:    r.kind = OpKind::DropTable; break;
    case OpKind::DropTable:      r.kind = OpKind::CreateTable; break;
    case OpKind::AddColumn:      r.kind = OpKind::DropColumn; r.before = op.after; r.after.reset(); break;
    case OpKind::DropColumn:     r.kind = OpKind::AddColumn; r.after = op.before; r.before.reset(); break;
    case OpKind::ModifyColumn:   r.before = op.after; r.after = op.before; break;
    case OpKind::RenameColumn:   r.before = op.after; r.after = op.before; break;
    case OpKind::AddIndex:       r.kind = OpKind::DropIndex; break;
    case OpKind::DropIndex:      r.kind = OpKind::AddIndex; break;
    case OpKind::AddForeignKey:  r.kind = OpKind::DropForeignKey; break;
    case OpKind::DropForeignKey: r.kind = OpKind::AddForeignKey; break;
    case OpKind::RenameCandidate:
        THROW_AS(DiffAmbiguityError, "cannot invert unresolved rename candidate " + op.describe());
    }
    return r;
}
