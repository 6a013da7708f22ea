#pragma once
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "dbpool.hpp"
#include "ddl_visitor.hpp"
#include "migration.hpp"
#include "schemadiff.hpp"

struct GeneratorOptions {
    std::string description;
    std::optional<bool> requires_backup; // defaults to the destructive flag
    bool auto_rollback_on_error = true;
    bool can_run_in_parallel = false;
    std::set<std::string> depends_on;
    std::set<std::string> conflicts_with;
};

struct SquashResult {
    MigrationRecord baseline;
    StrList replaced; // versions of the squashed run, in order
};

// Turns schema diffs into reversible SQL-backed migration records.
class MigrationGenerator {
public:
    explicit MigrationGenerator(std::unique_ptr<DDLVisitor> visitor = std::make_unique<SqliteDDLVisitor>());

    // @p diff may still hold rename candidates; each needs a decision in @p decisions
    MigrationRecord generate(const SchemaSnapshot& actual, const SchemaDiff& diff,
        const RenameDecisions& decisions, const std::string& version, const GeneratorOptions& opts = {});

    // diff(desired, actual) followed by generate()
    MigrationRecord generate(const SchemaSnapshot& desired, const SchemaSnapshot& actual,
        const RenameDecisions& decisions, const std::string& version, const GeneratorOptions& opts = {});

    // Collapses records[from..to] (sorted by version, @p from empty = first record) into one baseline
    // with version @p to, by replaying them on a scratch database opened through @p scratch.
    SquashResult squash(const std::vector<MigrationRecord>& records, const std::string& from,
        const std::string& to, const ConnectionFactory& scratch);

private:
    std::vector<SchemaExpectation> expectations(const SchemaDiff& resolved);
    std::unique_ptr<DDLVisitor> visitor_;
};
