/**
 * fsgate CLI - rm command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace fsgate::cli::commands {

namespace {

struct RemoveOptions {
    std::string path;
};

int cmd_remove(const GlobalOptions& opts, const RemoveOptions& rm_opts) {
    auto ws = open_workspace(opts);
    if (!ws) {
        return EXIT_NO_ROOT;
    }

    auto result = ws->deleteFile(rm_opts.path);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return EXIT_FAILED;
    }

    print_success("Deleted " + rm_opts.path, opts);
    return EXIT_OK;
}

} // anonymous namespace

void setup_remove(CLI::App* app, GlobalOptions& opts) {
    static RemoveOptions rm_opts;

    app->add_option("path", rm_opts.path, "File to delete")->required();

    app->callback([&opts]() {
        std::exit(cmd_remove(opts, rm_opts));
    });
}

} // namespace fsgate::cli::commands
