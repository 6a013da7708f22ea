#include "backup.hpp"
#include "log.hpp"
#include "migration.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace {

const logging::Logger& backup_log() {
    static const logging::Logger log { logging::BACKUP_LOGGER };
    return log;
}

// database names never contain the "__" separator
std::string sanitize(const std::string& name) {
    std::string out;
    for (char c : name) {
        char ch = (std::isalnum(static_cast<unsigned char>(c)) || c == '-') ? c : '_';
        if (ch == '_' && !out.empty() && out.back() == '_') continue;
        out += ch;
    }
    while (!out.empty() && out.back() == '_') out.pop_back();
    return out.empty() ? "db" : out;
}

} // anonymous namespace

BackupManager::BackupManager(pool::IDbPool& db, std::string backup_dir)
    : db_(db)
    , dir_(std::move(backup_dir))
    , database_(sanitize(fs::path(db.dsn()).stem().string())) { }

std::string BackupManager::file_name(const std::string& version, int64_t created_at) const {
    std::string name = BACKUP_PREFIX + database_;
    if (!version.empty()) name += BACKUP_SEP + version;
    return name + BACKUP_SEP + timestamp_ms(created_at) + BACKUP_EXT;
}

std::optional<BackupFile> BackupManager::parse_name(const std::string& file_name) {
    std::string stem = file_name;
    if (stem.rfind(BACKUP_PREFIX, 0) != 0) return std::nullopt;
    if (stem.size() < 3 || stem.substr(stem.size() - 3) != BACKUP_EXT) return std::nullopt;
    stem = stem.substr(std::string(BACKUP_PREFIX).size(), stem.size() - std::string(BACKUP_PREFIX).size() - 3);

    auto last = stem.rfind(BACKUP_SEP);
    if (last == std::string::npos) return std::nullopt;
    BackupFile b;
    b.id = file_name;
    b.created_at = parse_timestamp_ms(stem.substr(last + 2));
    if (b.created_at < 0) return std::nullopt;
    std::string rest = stem.substr(0, last);
    auto mid = rest.rfind(BACKUP_SEP);
    if (mid == std::string::npos) {
        b.database = rest;
    } else {
        b.database = rest.substr(0, mid);
        b.version = rest.substr(mid + 2);
    }
    if (b.database.empty()) return std::nullopt;
    return b;
}

BackupFile BackupManager::create(const std::string& version) {
    if (!version.empty() && !is_valid_version(version)) {
        THROW_AS(MigrationError, "invalid backup version '" + version + "'");
    }
    fs::create_directories(dir_);
    int64_t created = now_ms();
    // two backups of one version in the same millisecond must not collide
    while (fs::exists(fs::path(dir_) / file_name(version, created))) ++created;

    BackupFile b;
    b.id = file_name(version, created);
    b.path = (fs::path(dir_) / b.id).string();
    b.created_at = created;
    b.database = database_;
    b.version = version;

    pool::with_conn(db_, pool::DbIntent::Read, [&](SQLConnection& conn) { conn.export_to(b.path); });
    b.size = fs::file_size(b.path);
    backup_log().info("backup {} created ({})", b.id, format_size(b.size));
    return b;
}

std::vector<BackupFile> BackupManager::list() const {
    std::vector<BackupFile> out;
    if (!fs::exists(dir_)) return out;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        if (!entry.is_regular_file()) continue;
        auto b = parse_name(entry.path().filename().string());
        if (!b || b->database != database_) continue;
        b->path = entry.path().string();
        b->size = entry.file_size();
        out.push_back(std::move(*b));
    }
    std::sort(out.begin(), out.end(), [](const BackupFile& a, const BackupFile& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
    });
    return out;
}

std::optional<BackupFile> BackupManager::find(const std::string& version) const {
    for (const auto& b : list()) {
        if (b.version == version) return b;
    }
    return std::nullopt;
}

BackupFile BackupManager::restore(const std::string& version) {
    auto b = find(version);
    if (!b) THROW_AS(BackupNotFoundError, "no backup of " + database_ + " for version '" + version + "'");
    pool::with_conn(db_, pool::DbIntent::Write, [&](SQLConnection& conn) { conn.import_from(b->path); });
    backup_log().warn("database restored from {}", b->id);
    return *b;
}

int BackupManager::cleanup(int retention_days, int64_t now) {
    if (retention_days < 0) THROW("retention days must not be negative");
    const int64_t cutoff = now - static_cast<int64_t>(retention_days) * 24 * 60 * 60 * 1000;
    int deleted = 0;
    for (const auto& b : list()) {
        if (b.created_at > cutoff) continue;
        std::error_code ec;
        if (fs::remove(b.path, ec)) {
            ++deleted;
            backup_log().info("backup {} deleted", b.id);
        } else {
            backup_log().error("cannot delete backup {}: {}", b.id, ec.message());
        }
    }
    return deleted;
}

std::uintmax_t BackupManager::total_size() const {
    std::uintmax_t total = 0;
    for (const auto& b : list()) total += b.size;
    return total;
}

std::string BackupManager::format_size(std::uintmax_t bytes) {
    static const char* units[] = { "B", "KB", "MB", "GB" };
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024 && unit < 3) {
        size /= 1024;
        ++unit;
    }
    return std::format("{:.2f} {}", size, units[unit]);
}
