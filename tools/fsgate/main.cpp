/**
 * fsgate CLI - Entry Point
 *
 * Root-confined file operations from the command line.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef FSGATE_VERSION
#define FSGATE_VERSION "unknown"
#endif

// Forward declarations for commands
namespace fsgate::cli::commands {
    void setup_read(CLI::App* app, GlobalOptions& opts);
    void setup_write(CLI::App* app, GlobalOptions& opts);
    void setup_write_binary(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_remove(CLI::App* app, GlobalOptions& opts);
    void setup_root(CLI::App* app, GlobalOptions& opts);
    void setup_join(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace fsgate::cli;

    CLI::App app{"fsgate - root-confined file operations"};
    app.set_version_flag("-V,--version", FSGATE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Root directory (default: $FSGATE_ROOT, config, or cwd)");
    app.add_option("--config", opts.config, "JSON config file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    auto* verbose = app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only")->excludes(verbose);

    // Commands
    commands::setup_read(app.add_subcommand("read", "Print a text file"), opts);
    commands::setup_write(app.add_subcommand("write", "Write a text file"), opts);
    commands::setup_write_binary(app.add_subcommand("write-binary", "Write a binary file"), opts);
    commands::setup_list(app.add_subcommand("ls", "List files in a directory"), opts);
    commands::setup_remove(app.add_subcommand("rm", "Delete a file"), opts);
    commands::setup_root(app.add_subcommand("root", "Print the canonical root"), opts);
    commands::setup_join(app.add_subcommand("join", "Join path segments"), opts);
    commands::setup_check(app.add_subcommand("check", "Validate a path against the root"), opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return EXIT_OK;
}
