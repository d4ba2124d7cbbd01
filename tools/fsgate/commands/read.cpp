/**
 * fsgate CLI - read command
 *
 * Print a text file from the workspace.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace fsgate::cli::commands {

namespace {

struct ReadOptions {
    std::string path;
};

int cmd_read(const GlobalOptions& opts, const ReadOptions& read_opts) {
    auto ws = open_workspace(opts);
    if (!ws) {
        return EXIT_NO_ROOT;
    }

    auto result = ws->readText(read_opts.path);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return EXIT_FAILED;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"content", result.value()}});
    } else {
        std::cout << result.value();
        std::cout.flush();
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_read(CLI::App* app, GlobalOptions& opts) {
    static ReadOptions read_opts;

    app->add_option("path", read_opts.path, "File to read")->required();

    app->callback([&opts]() {
        std::exit(cmd_read(opts, read_opts));
    });
}

} // namespace fsgate::cli::commands
