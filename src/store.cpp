#include "store.hpp"
#include "log.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

const logging::Logger& gen_log() {
    static const logging::Logger log { logging::GENERATOR_LOGGER };
    return log;
}

StrList to_list(const std::set<std::string>& s) {
    return StrList(s.begin(), s.end());
}

std::set<std::string> to_set(const StrList& l) {
    return std::set<std::string>(l.begin(), l.end());
}

} // anonymous namespace

MigrationStore::MigrationStore(std::string dir)
    : dir_(std::move(dir)) { }

std::string MigrationStore::path_for(const std::string& version) const {
    return (fs::path(dir_) / (MIGRATION_FILE_PREFIX + version + MIGRATION_FILE_EXT)).string();
}

bool MigrationStore::exists(const std::string& version) const {
    return fs::exists(path_for(version));
}

void MigrationStore::to_json(const MigrationRecord& r, jval& out, jdaloc& a) {
    if (!r.sql_backed()) THROW_AS(MigrationError, "migration " + r.version + " has no SQL body to persist");
    out.SetObject();
    jhlp::set(out, "version", r.version, a);
    jhlp::set(out, "description", r.description, a);
    jhlp::set(out, "isDestructive", r.is_destructive, a);
    jhlp::set(out, "requiresBackup", r.requires_backup, a);
    jhlp::set(out, "autoRollbackOnError", r.auto_rollback_on_error, a);
    jhlp::set(out, "canRunInParallel", r.can_run_in_parallel, a);
    jhlp::set_strings(out, "dependsOn", to_list(r.depends_on), a);
    jhlp::set_strings(out, "conflictsWith", to_list(r.conflicts_with), a);
    jhlp::set_strings(out, "squashed", r.squashed, a);
    StrList expects;
    for (const auto& e : r.expects) expects.push_back(e.str());
    jhlp::set_strings(out, "expects", expects, a);
    jhlp::set_strings(out, "up", r.up_sql, a);
    jhlp::set_strings(out, "down", r.down_sql, a);
}

MigrationRecord MigrationStore::from_json(const jval& doc) {
    if (!doc.IsObject()) THROW_AS(MigrationError, "migration artifact must be a JSON object");
    MigrationRecord r;
    r.version = jhlp::get<std::string>(doc, "version");
    if (!is_valid_version(r.version)) THROW_AS(MigrationError, "migration artifact has invalid version '" + r.version + "'");
    r.description = jhlp::get<std::string>(doc, "description");
    r.is_destructive = jhlp::get<bool>(doc, "isDestructive", false);
    r.requires_backup = jhlp::get<bool>(doc, "requiresBackup", r.is_destructive);
    r.auto_rollback_on_error = jhlp::get<bool>(doc, "autoRollbackOnError", true);
    r.can_run_in_parallel = jhlp::get<bool>(doc, "canRunInParallel", false);
    r.depends_on = to_set(jhlp::get_strings(doc, "dependsOn"));
    r.conflicts_with = to_set(jhlp::get_strings(doc, "conflictsWith"));
    r.squashed = jhlp::get_strings(doc, "squashed");
    for (const auto& e : jhlp::get_strings(doc, "expects")) r.expects.push_back(SchemaExpectation::parse(e));
    r.up_sql = jhlp::get_strings(doc, "up");
    r.down_sql = jhlp::get_strings(doc, "down");
    bind_sql(r);
    return r;
}

std::string MigrationStore::save(const MigrationRecord& record) {
    fs::create_directories(dir_);
    std::string path = path_for(record.version);
    if (fs::exists(path)) THROW_AS(MigrationError, "migration artifact already exists: " + path);
    jdoc doc;
    to_json(record, doc, doc.GetAllocator());
    jhlp::write_file(path, doc);
    gen_log().info("wrote migration {}", path);
    return path;
}

void MigrationStore::remove(const std::string& version) {
    std::error_code ec;
    if (!fs::remove(path_for(version), ec) || ec) {
        THROW_AS(MigrationError, "cannot remove migration artifact " + path_for(version));
    }
}

void MigrationStore::replace(const StrList& removed, const MigrationRecord& baseline) {
    fs::create_directories(dir_);
    std::string path = path_for(baseline.version);
    std::string staged = path + ".tmp";
    jdoc doc;
    to_json(baseline, doc, doc.GetAllocator());
    jhlp::write_file(staged, doc);

    std::error_code ec;
    fs::rename(staged, path, ec);
    if (ec) {
        fs::remove(staged, ec);
        THROW_AS(MigrationError, "cannot move squashed baseline into place: " + path);
    }
    gen_log().info("wrote squashed migration {}", path);

    for (const auto& v : removed) {
        if (v != baseline.version && exists(v)) remove(v);
    }
}

MigrationRecord MigrationStore::load_file(const std::string& path) const {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) THROW_AS(MigrationError, "cannot read migration artifact " + path);
    return from_json(doc);
}

MigrationRecord MigrationStore::load(const std::string& version) const {
    if (!exists(version)) THROW_AS(MigrationError, "no migration artifact for version " + version);
    return load_file(path_for(version));
}

std::vector<MigrationRecord> MigrationStore::load_all() const {
    std::vector<MigrationRecord> out;
    if (!fs::exists(dir_)) return out;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (name.rfind(MIGRATION_FILE_PREFIX, 0) != 0 || entry.path().extension() != MIGRATION_FILE_EXT) continue;
        MigrationRecord r = load_file(entry.path().string());
        std::string expected = MIGRATION_FILE_PREFIX + r.version + MIGRATION_FILE_EXT;
        if (expected != name) THROW_AS(MigrationError, "artifact " + name + " holds version " + r.version);
        out.push_back(std::move(r));
    }
    std::sort(out.begin(), out.end(), [](const MigrationRecord& a, const MigrationRecord& b) { return a.version < b.version; });
    return out;
}
