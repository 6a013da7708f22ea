#include "config.hpp"
#include "jsonhlp.hpp"
#include <cstdlib>
#include <filesystem>

namespace {

void read_doc(Config& c, const jdoc& doc) {
    if (!doc.IsObject()) THROW_AS(ConfigError, "configuration must be a JSON object");
    auto expect = [&](const char* key, bool ok, const char* what) {
        if (doc.HasMember(key) && !ok) THROW_AS(ConfigError, std::string("config key '") + key + "' must be " + what);
    };
    expect("database", doc.HasMember("database") && doc["database"].IsString(), "a string");
    expect("migrations_dir", doc.HasMember("migrations_dir") && doc["migrations_dir"].IsString(), "a string");
    expect("backup_dir", doc.HasMember("backup_dir") && doc["backup_dir"].IsString(), "a string");
    expect("entities", doc.HasMember("entities") && doc["entities"].IsString(), "a string");
    expect("log_level", doc.HasMember("log_level") && doc["log_level"].IsString(), "a string");
    expect("log_file", doc.HasMember("log_file") && doc["log_file"].IsString(), "a string");
    expect("pool_size", doc.HasMember("pool_size") && doc["pool_size"].IsUint(), "a non-negative integer");
    expect("busy_timeout_ms", doc.HasMember("busy_timeout_ms") && doc["busy_timeout_ms"].IsInt(), "an integer");
    expect("acquire_timeout_ms", doc.HasMember("acquire_timeout_ms") && doc["acquire_timeout_ms"].IsInt(), "an integer");
    expect("retention_days", doc.HasMember("retention_days") && doc["retention_days"].IsInt(), "an integer");
    expect("parallel", doc.HasMember("parallel") && doc["parallel"].IsBool(), "a boolean");

    c.database = jhlp::get<std::string>(doc, "database", c.database);
    c.migrations_dir = jhlp::get<std::string>(doc, "migrations_dir", c.migrations_dir);
    c.backup_dir = jhlp::get<std::string>(doc, "backup_dir", c.backup_dir);
    c.entities = jhlp::get<std::string>(doc, "entities", c.entities);
    c.pool_size = jhlp::get<unsigned>(doc, "pool_size", c.pool_size);
    c.busy_timeout_ms = jhlp::get<int>(doc, "busy_timeout_ms", c.busy_timeout_ms);
    c.acquire_timeout_ms = jhlp::get<int>(doc, "acquire_timeout_ms", c.acquire_timeout_ms);
    c.parallel = jhlp::get<bool>(doc, "parallel", c.parallel);
    c.retention_days = jhlp::get<int>(doc, "retention_days", c.retention_days);
    c.log_level = jhlp::get<std::string>(doc, "log_level", c.log_level);
    c.log_file = jhlp::get<std::string>(doc, "log_file", c.log_file);
}

void env_override(std::string& target, const char* name) {
    const char* v = std::getenv(name);
    if (v && *v) target = v;
}

} // anonymous namespace

Config Config::from_json_str(const std::string& text) {
    Config c;
    jdoc doc;
    if (!jhlp::parse_str(text, doc)) THROW_AS(ConfigError, "configuration is not valid JSON");
    read_doc(c, doc);
    c.validate();
    return c;
}

Config Config::load(const std::string& path) {
    Config c;
    std::string file = path;
    if (file.empty()) {
        const char* env = std::getenv(CONFIG_ENV_FILE);
        if (env && *env) file = env;
    }
    bool required = !file.empty();
    if (file.empty()) file = CONFIG_DEFAULT_FILE;

    if (std::filesystem::exists(file)) {
        jdoc doc;
        if (!jhlp::parse_file(file, doc)) THROW_AS(ConfigError, "cannot parse configuration file " + file);
        read_doc(c, doc);
    } else if (required) {
        THROW_AS(ConfigError, "configuration file " + file + " not found");
    }
    c.apply_env();
    c.validate();
    return c;
}

void Config::apply_env() {
    env_override(database, "DBSHIFT_DATABASE");
    env_override(migrations_dir, "DBSHIFT_MIGRATIONS_DIR");
    env_override(backup_dir, "DBSHIFT_BACKUP_DIR");
    env_override(entities, "DBSHIFT_ENTITIES");
    env_override(log_level, "DBSHIFT_LOG_LEVEL");
    env_override(log_file, "DBSHIFT_LOG_FILE");
}

void Config::validate() const {
    if (database.empty()) THROW_AS(ConfigError, "database must not be empty");
    if (migrations_dir.empty()) THROW_AS(ConfigError, "migrations_dir must not be empty");
    if (backup_dir.empty()) THROW_AS(ConfigError, "backup_dir must not be empty");
    if (pool_size == 0) THROW_AS(ConfigError, "pool_size must be at least 1");
    if (busy_timeout_ms < 0) THROW_AS(ConfigError, "busy_timeout_ms must not be negative");
    if (acquire_timeout_ms <= 0) THROW_AS(ConfigError, "acquire_timeout_ms must be positive");
    if (retention_days < 0) THROW_AS(ConfigError, "retention_days must not be negative");
    static const char* levels[] = { "trace", "debug", "info", "warn", "error", "critical", "off" };
    bool known = false;
    for (const char* l : levels) known = known || log_level == l;
    if (!known) THROW_AS(ConfigError, "unknown log_level '" + log_level + "'");
}
