#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "dbpool.hpp"

#define BACKUP_PREFIX "backup_"
#define BACKUP_EXT    ".db"
#define BACKUP_SEP    "__"

struct BackupFile {
    std::string id;      // file name
    std::string path;
    std::uintmax_t size = 0;
    int64_t created_at = 0; // unix ms, encoded in the name
    std::string database;
    std::string version; // empty for backups not tied to a migration
};

/**
 * @brief Point-in-time copies of the database, keyed to migration versions.
 *
 * Files are named backup_<database>__<version>__<YYYYMMDDHHMMSSmmm>.db so that
 * restore() can match a version exactly and cleanup() can age files without
 * relying on file system timestamps.
 */
class BackupManager {
public:
    BackupManager(pool::IDbPool& db, std::string backup_dir);

    /**
     * @brief Full copy of the database through the SQLite online backup API.
     *
     * Must run outside any migration transaction, strictly before the
     * corresponding up() begins.
     *
     * @param version migration version the backup protects, may be empty
     * @return the written backup
     */
    BackupFile create(const std::string& version);

    // backups of this database, most recent first
    std::vector<BackupFile> list() const;
    // newest backup tagged with exactly @p version
    std::optional<BackupFile> find(const std::string& version) const;

    /**
     * @brief Replaces the database content with the newest backup of @p version.
     *
     * No nearest-match fallback. Throws BackupNotFoundError when nothing matches.
     */
    BackupFile restore(const std::string& version);

    /**
     * @brief Deletes every backup created at or before now - retention_days.
     *
     * 0 deletes everything, a large value deletes nothing.
     * @return number of files deleted
     */
    int cleanup(int retention_days, int64_t now = now_ms());

    std::uintmax_t total_size() const;
    static std::string format_size(std::uintmax_t bytes);

    static std::optional<BackupFile> parse_name(const std::string& file_name);
    std::string file_name(const std::string& version, int64_t created_at) const;
    const std::string& database_name() const { return database_; }
    const std::string& dir() const { return dir_; }

private:
    pool::IDbPool& db_;
    std::string dir_;
    std::string database_;
};
