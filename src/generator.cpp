#include "generator.hpp"
#include "introspector.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include <algorithm>

namespace {

const logging::Logger& gen_log() {
    static const logging::Logger log { logging::GENERATOR_LOGGER };
    return log;
}

void append(StrList& out, const StrList& more) {
    out.insert(out.end(), more.begin(), more.end());
}

void replay(SQLConnection& conn, const MigrationRecord& r) {
    if (!r.up) THROW_AS(SquashError, "migration " + r.version + " has no up operation");
    Transaction tr(conn);
    r.up(conn);
    tr.commit();
}

} // anonymous namespace

MigrationGenerator::MigrationGenerator(std::unique_ptr<DDLVisitor> visitor)
    : visitor_(std::move(visitor)) {
    if (!visitor_) THROW("MigrationGenerator: null DDL visitor");
}

std::vector<SchemaExpectation> MigrationGenerator::expectations(const SchemaDiff& resolved) {
    using K = SchemaExpectation::Kind;
    std::vector<SchemaExpectation> out;
    std::set<std::string> seen, created, replaced_idx;
    auto add = [&](K kind, bool present, const std::string& table, const std::string& name) {
        SchemaExpectation e { kind, present, table, name };
        if (seen.insert(e.str()).second) out.push_back(e);
    };
    for (const auto& op : resolved.ops) {
        if (op.kind == OpKind::CreateTable) created.insert(op.table);
        if (op.kind == OpKind::DropIndex) replaced_idx.insert(op.index->name);
    }
    for (const auto& op : resolved.ops) {
        if (created.count(op.table) && op.kind != OpKind::CreateTable) continue;
        switch (op.kind) {
        case OpKind::CreateTable:  add(K::Table, false, op.table, ""); break;
        case OpKind::DropTable:    add(K::Table, true, op.table, ""); break;
        case OpKind::AddColumn:
            add(K::Table, true, op.table, "");
            add(K::Column, false, op.table, op.after->name);
            break;
        case OpKind::DropColumn:
        case OpKind::ModifyColumn:
            add(K::Column, true, op.table, op.before->name);
            break;
        case OpKind::RenameColumn:
            add(K::Column, true, op.table, op.before->name);
            add(K::Column, false, op.table, op.after->name);
            break;
        case OpKind::AddIndex:
            if (!replaced_idx.count(op.index->name)) add(K::Index, false, op.table, op.index->name);
            break;
        case OpKind::DropIndex:
            add(K::Index, true, op.table, op.index->name);
            break;
        default:
            break;
        }
    }
    return out;
}

MigrationRecord MigrationGenerator::generate(const SchemaSnapshot& actual, const SchemaDiff& diff,
    const RenameDecisions& decisions, const std::string& version, const GeneratorOptions& opts) {
    SchemaDiff resolved = resolve(diff, decisions);
    if (resolved.empty()) THROW_AS(MigrationError, "no schema changes to generate");

    SchemaSnapshot working = actual;
    StrList up, down;
    for (const auto& op : resolved.ops) {
        append(up, visitor_->visit(op, working));
        apply_op(working, op);
    }
    // walk back from the desired state, undoing one op at a time
    for (auto it = resolved.ops.rbegin(); it != resolved.ops.rend(); ++it) {
        DiffOp inv = invert(*it);
        append(down, visitor_->visit(inv, working));
        apply_op(working, inv);
    }

    MigrationRecord r = make_sql_migration(version, std::move(up), std::move(down), opts.description);
    r.is_destructive = resolved.destructive();
    r.requires_backup = opts.requires_backup.value_or(r.is_destructive);
    r.auto_rollback_on_error = opts.auto_rollback_on_error;
    r.can_run_in_parallel = opts.can_run_in_parallel;
    r.depends_on = opts.depends_on;
    r.conflicts_with = opts.conflicts_with;
    r.expects = expectations(resolved);
    bind_sql(r);
    if (r.description.empty()) r.description = join(resolved.describe(), "; ");

    gen_log().info("generated migration {} ({} up / {} down statements{})", version, r.up_sql.size(),
        r.down_sql.size(), r.is_destructive ? ", destructive" : "");
    return r;
}

MigrationRecord MigrationGenerator::generate(const SchemaSnapshot& desired, const SchemaSnapshot& actual,
    const RenameDecisions& decisions, const std::string& version, const GeneratorOptions& opts) {
    return generate(actual, diff(desired, actual), decisions, version, opts);
}

SquashResult MigrationGenerator::squash(const std::vector<MigrationRecord>& records, const std::string& from,
    const std::string& to, const ConnectionFactory& scratch) {
    auto index_of = [&](const std::string& v) -> size_t {
        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i].version == v) return i;
        }
        THROW_AS(SquashError, "unknown migration version '" + v + "'");
    };
    if (records.empty()) THROW_AS(SquashError, "no migrations to squash");
    size_t first = from.empty() ? 0 : index_of(from);
    size_t last = index_of(to);
    if (first >= last) THROW_AS(SquashError, "squash range must hold at least two migrations");

    SquashResult result;
    std::set<std::string> range;
    for (size_t i = first; i <= last; ++i) {
        range.insert(records[i].version);
        result.replaced.push_back(records[i].version);
    }

    GeneratorOptions opts;
    opts.description = "squash of " + records[first].version + ".." + to;
    for (size_t i = 0; i < records.size(); ++i) {
        const MigrationRecord& r = records[i];
        if (range.count(r.version)) {
            for (const auto& d : r.depends_on) {
                if (!range.count(d)) opts.depends_on.insert(d);
            }
            for (const auto& c : r.conflicts_with) {
                if (!range.count(c)) opts.conflicts_with.insert(c);
            }
            continue;
        }
        for (const auto& d : r.depends_on) {
            if (range.count(d) && d != to) {
                THROW_AS(SquashError, "migration " + r.version + " depends on " + d + " inside the squashed range");
            }
        }
    }
    for (const auto& d : opts.depends_on) {
        if (d > to) THROW_AS(SquashError, "squashed range depends on later migration " + d);
    }

    PSQLConnection conn = scratch();
    if (!conn) THROW_AS(SquashError, "scratch connection factory returned null");
    conn->connect(":memory:");
    for (size_t i = 0; i < first; ++i) replay(*conn, records[i]);
    SchemaSnapshot before = SchemaIntrospector(*conn, { LEDGER_TABLE }).snapshot();
    for (size_t i = first; i <= last; ++i) replay(*conn, records[i]);
    SchemaSnapshot after = SchemaIntrospector(*conn, { LEDGER_TABLE }).snapshot();
    conn->disconnect();

    SchemaDiff d = diff(after, before);
    if (d.empty()) THROW_AS(SquashError, "migrations " + records[first].version + ".." + to + " have no net schema effect");

    // a candidate counts as a rename only when the run itself renamed that column
    RenameDecisions decisions;
    for (const auto* c : d.rename_candidates()) {
        std::string stmt = "ALTER TABLE " + c->table + " RENAME COLUMN " + c->before->name + " TO " + c->after->name;
        bool renamed = false;
        for (size_t i = first; i <= last && !renamed; ++i) {
            renamed = std::find(records[i].up_sql.begin(), records[i].up_sql.end(), stmt) != records[i].up_sql.end();
        }
        if (renamed) decisions.confirm(c->table, c->before->name, c->after->name);
        else decisions.deny(c->table, c->before->name, c->after->name);
    }

    result.baseline = generate(before, d, decisions, to, opts);
    result.baseline.squashed = result.replaced;
    gen_log().info("squashed {} migrations into baseline {}", result.replaced.size(), to);
    return result;
}
