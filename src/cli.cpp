#include "cli.hpp"
#include "backup.hpp"
#include "dbpool.hpp"
#include "executor.hpp"
#include "generator.hpp"
#include "introspector.hpp"
#include "log.hpp"
#include "store.hpp"
#include <format>

namespace {

const logging::Logger& cli_log() {
    static const logging::Logger log { logging::MAIN_LOGGER };
    return log;
}

const char* state_name(MigrationStatus::State s) {
    switch (s) {
    case MigrationStatus::State::Executed: return "executed";
    case MigrationStatus::State::Failed:   return "FAILED";
    default:                               return "pending";
    }
}

} // anonymous namespace

/****************** ARGUMENTS */

CliArgs CliArgs::parse(int argc, const char* const* argv) {
    CliArgs a;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq == std::string::npos) a.options[arg.substr(2)] = "";
            else a.options[arg.substr(2, eq - 2)] = arg.substr(eq + 1);
        } else if (a.command.empty()) {
            a.command = arg;
        } else {
            a.positional.push_back(arg);
        }
    }
    return a;
}

std::string CliArgs::option(const std::string& name, const std::string& def) const {
    auto it = options.find(name);
    return it == options.end() ? def : it->second;
}

int CliArgs::int_option(const std::string& name, int def) const {
    auto it = options.find(name);
    if (it == options.end()) return def;
    try {
        size_t used = 0;
        int v = std::stoi(it->second, &used);
        if (used == it->second.size()) return v;
    } catch (const std::exception&) {
    }
    throw UsageError("--" + name + " expects an integer, got '" + it->second + "'");
}

/****************** COMMANDS */

Cli::Cli(Config config, std::istream& in, std::ostream& out)
    : config_(std::move(config))
    , in_(in)
    , out_(out) { }

Cli::~Cli() = default;

void Cli::usage(std::ostream& out) {
    out << "usage: dbshift <command> [options]\n"
           "\n"
           "  migration:migrate [--dry-run]            run pending migrations\n"
           "  migration:rollback [--steps=N|--version=V]  revert executed migrations\n"
           "  migration:refresh --force                rollback everything, then migrate\n"
           "  migration:fresh --force                  drop every table, then migrate\n"
           "  migration:squash --to=V [--from=V]       collapse a run of migrations into one\n"
           "  show:migrations                          executed, failed and pending migrations\n"
           "  make:migration [--yes|--no] [--description=TEXT]\n"
           "                                           diff the entity file against the database\n"
           "  show:backups                             list backups of the database\n"
           "  cleanup:backups [--days=N]               delete backups older than N days\n"
           "  restore:backup <version>                 restore the newest backup of a version\n"
           "  help                                     this text\n"
           "\n"
           "global options: --config=PATH\n";
}

void Cli::open() {
    if (executor_) return;
    pool::AcquirePolicy policy;
    policy.acquire_timeout = std::chrono::milliseconds(config_.acquire_timeout_ms);
    int busy = config_.busy_timeout_ms;
    pool_ = std::make_unique<DbPool>(config_.pool_size, config_.database,
        [busy]() { return make_sqlite_connection(busy); }, policy);
    backups_ = std::make_unique<BackupManager>(*pool_, config_.backup_dir);
    store_ = std::make_unique<MigrationStore>(config_.migrations_dir);

    ExecutorOptions opts;
    opts.parallel = config_.parallel;
    executor_ = std::make_unique<MigrationExecutor>(*pool_, backups_.get(), store_->load_all(), opts);
    cli_log().debug("opened {} with {} known migration(s)", config_.database, executor_->records().size());
}

bool Cli::ask(const std::string& question) {
    out_ << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(in_, answer)) return false;
    answer = to_lower(trim(answer));
    return answer == "y" || answer == "yes";
}

int Cli::run(const CliArgs& args) {
    const std::string& c = args.command;
    if (c.empty() || c == "help") {
        usage(out_);
        return c.empty() ? EXIT_USAGE : 0;
    }
    if (c == "migration:migrate") return migrate(args);
    if (c == "migration:rollback") return rollback(args);
    if (c == "migration:refresh") return refresh(args);
    if (c == "migration:fresh") return fresh(args);
    if (c == "migration:squash") return squash(args);
    if (c == "show:migrations") return show_migrations(args);
    if (c == "make:migration") return make_migration(args);
    if (c == "show:backups") return show_backups(args);
    if (c == "cleanup:backups") return cleanup_backups(args);
    if (c == "restore:backup") return restore_backup(args);
    throw UsageError("unknown command '" + c + "'");
}

int Cli::migrate(const CliArgs& args) {
    open();
    executor_->options().dry_run = args.flag("dry-run");
    MigrateResult r = executor_->migrate();
    if (args.flag("dry-run")) {
        if (r.preview.empty()) out_ << "Nothing to migrate.\n";
        for (const auto& line : r.preview) out_ << line << "\n";
        return 0;
    }
    if (r.executed.empty()) {
        out_ << "Nothing to migrate.\n";
        return 0;
    }
    for (const auto& v : r.executed) out_ << "Migrated: " << v << "\n";
    out_ << std::format("Batch {}: {} migration(s).\n", r.batch, r.executed.size());
    return 0;
}

int Cli::rollback(const CliArgs& args) {
    if (args.flag("steps") && args.flag("version")) throw UsageError("use either --steps or --version");
    open();
    StrList reverted;
    if (args.flag("version")) {
        reverted = executor_->rollback_to(args.option("version"));
    } else {
        int steps = args.int_option("steps", 1);
        if (steps < 1) throw UsageError("--steps must be at least 1");
        reverted = executor_->rollback(steps);
    }
    if (reverted.empty()) out_ << "Nothing to roll back.\n";
    for (const auto& v : reverted) out_ << "Rolled back: " << v << "\n";
    return 0;
}

int Cli::refresh(const CliArgs& args) {
    open();
    MigrateResult r = executor_->refresh(args.flag("force"));
    out_ << std::format("Refreshed: {} migration(s) executed.\n", r.executed.size());
    return 0;
}

int Cli::fresh(const CliArgs& args) {
    open();
    MigrateResult r = executor_->fresh(args.flag("force"));
    out_ << std::format("Fresh database: {} migration(s) executed.\n", r.executed.size());
    return 0;
}

int Cli::squash(const CliArgs& args) {
    if (args.option("to").empty()) throw UsageError("migration:squash needs --to=VERSION");
    open();
    MigrationGenerator generator;
    int busy = config_.busy_timeout_ms;
    SquashResult r = executor_->squash(args.option("from"), args.option("to"), *store_, generator,
        [busy]() { return make_sqlite_connection(busy); });
    out_ << std::format("Squashed {} migration(s) into {}.\n", r.replaced.size(), r.baseline.version);
    return 0;
}

int Cli::show_migrations(const CliArgs&) {
    open();
    auto rows = executor_->status();
    if (rows.empty()) {
        out_ << "No migrations.\n";
        return 0;
    }
    out_ << std::format("{:<10} {:<20} {:<6} {:<25} {}\n", "STATE", "VERSION", "BATCH", "EXECUTED AT", "DESCRIPTION");
    for (const auto& s : rows) {
        std::string batch = s.batch ? std::to_string(s.batch) : "";
        std::string desc = s.known ? s.description : "(no migration file)";
        out_ << std::format("{:<10} {:<20} {:<6} {:<25} {}\n", state_name(s.state), s.version, batch, s.executed_at, desc);
    }
    return 0;
}

int Cli::make_migration(const CliArgs& args) {
    if (args.flag("yes") && args.flag("no")) throw UsageError("use either --yes or --no");
    std::string entities = args.option("entities", config_.entities);
    if (entities.empty()) throw UsageError("no entity file: set \"entities\" in the configuration or pass --entities=PATH");
    open();

    SchemaSnapshot desired = SchemaSnapshot::load(entities);
    SchemaSnapshot actual = pool::with_conn(*pool_, pool::DbIntent::Read,
        [](SQLConnection& conn) { return SchemaIntrospector(conn, { LEDGER_TABLE }).snapshot(); });
    SchemaDiff d = diff(desired, actual);
    if (d.empty()) {
        out_ << "Nothing to migrate: the database matches " << entities << ".\n";
        return 0;
    }

    RenameDecisions decisions;
    if (args.flag("yes")) decisions.answer_all(true);
    else if (args.flag("no")) decisions.answer_all(false);
    else {
        for (const auto* c : d.rename_candidates()) {
            std::string q = std::format("Rename {}.{} to {}? (similarity {:.2f})", c->table, c->before->name,
                c->after->name, c->similarity);
            if (ask(q)) decisions.confirm(c->table, c->before->name, c->after->name);
            else decisions.deny(c->table, c->before->name, c->after->name);
        }
    }

    std::string newest = executor_->records().empty() ? "" : executor_->records().back().version;
    GeneratorOptions opts;
    opts.description = args.option("description");
    MigrationGenerator generator;
    MigrationRecord r = generator.generate(actual, d, decisions, next_version(newest), opts);
    std::string path = store_->save(r);

    out_ << "Created migration " << r.version << " (" << path << ")\n";
    for (const auto& sql : r.up_sql) out_ << "  " << sql << "\n";
    if (r.is_destructive) out_ << "Warning: this migration is destructive and takes a backup before it runs.\n";
    return 0;
}

int Cli::show_backups(const CliArgs&) {
    open();
    auto files = backups_->list();
    if (files.empty()) {
        out_ << "No backups of " << backups_->database_name() << ".\n";
        return 0;
    }
    out_ << std::format("{:<20} {:<25} {:>10}  {}\n", "VERSION", "CREATED AT", "SIZE", "FILE");
    for (const auto& b : files) {
        out_ << std::format("{:<20} {:<25} {:>10}  {}\n", b.version.empty() ? "-" : b.version, iso_utc(b.created_at),
            BackupManager::format_size(b.size), b.id);
    }
    out_ << std::format("{} backup(s), {} total\n", files.size(), BackupManager::format_size(backups_->total_size()));
    return 0;
}

int Cli::cleanup_backups(const CliArgs& args) {
    int days = args.int_option("days", config_.retention_days);
    if (days < 0) throw UsageError("--days must not be negative");
    open();
    int deleted = backups_->cleanup(days);
    out_ << std::format("Deleted {} backup(s) older than {} day(s).\n", deleted, days);
    return 0;
}

int Cli::restore_backup(const CliArgs& args) {
    if (args.positional.size() != 1) throw UsageError("restore:backup needs exactly one version");
    open();
    BackupFile b = backups_->restore(args.positional.front());
    out_ << "Restored " << backups_->database_name() << " from " << b.id << "\n";
    return 0;
}

/****************** ENTRY */

int run_cli(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err) {
    CliArgs args = CliArgs::parse(argc, argv);
    int rc = 1;
    try {
        Config config = Config::load(args.option("config"));
        logging::LogConfig lc;
        lc.level = logging::parse_level(config.log_level);
        lc.file_path = config.log_file;
        logging::init(lc);

        Cli cli(std::move(config), in, out);
        rc = cli.run(args);
    } catch (const UsageError& e) {
        err << "error: " << e.what() << "\n\n";
        Cli::usage(err);
        rc = EXIT_USAGE;
    } catch (const TransactionError& e) {
        err << "error: " << e.what() << "\n";
        if (!e.statement().empty()) err << "statement: " << e.statement() << "\n";
    } catch (const std::exception& e) {
        err << "error: " << e.what() << "\n";
    }
    logging::shutdown();
    return rc;
}
