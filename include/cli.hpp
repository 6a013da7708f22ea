#pragma once
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include "config.hpp"
#include "lib.hpp"

#define EXIT_USAGE 2

// bad command line, exits with EXIT_USAGE
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// dbshift <command> [--key=value | --flag]... [positional]...
struct CliArgs {
    std::string command;
    std::map<std::string, std::string> options; // flags map to ""
    StrList positional;

    static CliArgs parse(int argc, const char* const* argv);

    bool flag(const std::string& name) const { return options.count(name) > 0; }
    std::string option(const std::string& name, const std::string& def = "") const;
    int int_option(const std::string& name, int def) const;
};

class DbPool;
class BackupManager;
class MigrationExecutor;
class MigrationStore;

// The dbshift command set over one configured database.
class Cli {
public:
    Cli(Config config, std::istream& in = std::cin, std::ostream& out = std::cout);
    ~Cli();

    // exit code; MigrationError and friends propagate to the caller
    int run(const CliArgs& args);

    static void usage(std::ostream& out);

private:
    int migrate(const CliArgs& args);
    int rollback(const CliArgs& args);
    int refresh(const CliArgs& args);
    int fresh(const CliArgs& args);
    int squash(const CliArgs& args);
    int show_migrations(const CliArgs& args);
    int make_migration(const CliArgs& args);
    int show_backups(const CliArgs& args);
    int cleanup_backups(const CliArgs& args);
    int restore_backup(const CliArgs& args);

    void open();
    bool ask(const std::string& question);

    Config config_;
    std::istream& in_;
    std::ostream& out_;
    std::unique_ptr<DbPool> pool_;
    std::unique_ptr<BackupManager> backups_;
    std::unique_ptr<MigrationStore> store_;
    std::unique_ptr<MigrationExecutor> executor_;
};

// parses, loads the configuration (--config=PATH), sets up logging and runs; never throws
int run_cli(int argc, const char* const* argv, std::istream& in = std::cin, std::ostream& out = std::cout,
    std::ostream& err = std::cerr);
