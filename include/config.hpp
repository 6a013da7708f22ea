#pragma once
#include <string>
#include "lib.hpp"

#define CONFIG_DEFAULT_FILE "dbshift.json"
#define CONFIG_ENV_FILE     "DBSHIFT_CONFIG"

// Runtime settings, from a JSON file and then DBSHIFT_* environment variables.
struct Config {
    std::string database = "database.db";
    std::string migrations_dir = "migrations";
    std::string backup_dir = "backups";
    std::string entities; // entity file for make:migration
    unsigned pool_size = 4;
    int busy_timeout_ms = 5000;
    int acquire_timeout_ms = 1500;
    bool parallel = false;
    int retention_days = 30;
    std::string log_level = "info";
    std::string log_file;

    // @p path empty: DBSHIFT_CONFIG, then dbshift.json when present, else defaults.
    // An explicitly named file must exist.
    static Config load(const std::string& path = "");
    static Config from_json_str(const std::string& text);

    void apply_env();
    // throws ConfigError on the first invalid value
    void validate() const;
};
