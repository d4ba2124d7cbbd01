/**
 * fsgate CLI - ls command
 *
 * List the regular files directly inside a workspace directory.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace fsgate::cli::commands {

namespace {

struct ListOptions {
    std::string path = ".";
};

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    auto ws = open_workspace(opts);
    if (!ws) {
        return EXIT_NO_ROOT;
    }

    auto result = ws->listFiles(list_opts.path);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return EXIT_FAILED;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"files", result.value()}});
    } else {
        for (const auto& name : result.value()) {
            std::cout << name << std::endl;
        }
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_option("path", list_opts.path, "Directory to list (default: root)");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace fsgate::cli::commands
