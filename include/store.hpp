#pragma once
#include <string>
#include <vector>
#include "jsonhlp.hpp"
#include "migration.hpp"

#define MIGRATION_FILE_PREFIX "Migration_"
#define MIGRATION_FILE_EXT    ".json"

// Generated migration records persisted as one JSON artifact per version.
class MigrationStore {
public:
    explicit MigrationStore(std::string dir);

    // Writes a new artifact; an existing version is never overwritten.
    std::string save(const MigrationRecord& record);
    // Replaces the artifacts of @p removed by @p baseline (squash)
    void replace(const StrList& removed, const MigrationRecord& baseline);
    void remove(const std::string& version);

    bool exists(const std::string& version) const;
    std::string path_for(const std::string& version) const;

    // every artifact in the directory, sorted by version
    std::vector<MigrationRecord> load_all() const;
    MigrationRecord load(const std::string& version) const;

    static void to_json(const MigrationRecord& record, jval& out, jdaloc& alloc);
    static MigrationRecord from_json(const jval& doc);

    const std::string& dir() const { return dir_; }

private:
    MigrationRecord load_file(const std::string& path) const;
    std::string dir_;
};
