/**
 * fsgate CLI - root, join and check commands
 *
 * Path inspection without reading or writing anything.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <vector>

namespace fsgate::cli::commands {

namespace {

struct JoinOptions {
    std::vector<std::string> segments;
};

struct CheckOptions {
    std::string path;
};

int cmd_root(const GlobalOptions& opts) {
    auto ws = open_workspace(opts);
    if (!ws) {
        return EXIT_NO_ROOT;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"root", ws->root()}});
    } else {
        std::cout << ws->root() << std::endl;
    }
    return EXIT_OK;
}

// join never needs a root: it only builds a string
int cmd_join(const GlobalOptions& opts, const JoinOptions& join_opts) {
    std::string joined = join_paths(join_opts.segments);
    if (opts.json) {
        output_json({{"ok", true}, {"path", joined}});
    } else {
        std::cout << joined << std::endl;
    }
    return EXIT_OK;
}

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    auto ws = open_workspace(opts);
    if (!ws) {
        return EXIT_NO_ROOT;
    }

    auto result = ws->resolve(check_opts.path);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return EXIT_FAILED;
    }

    if (opts.json) {
        output_json({{"ok", true}, {"path", result.value()}});
    } else {
        std::cout << result.value() << std::endl;
    }
    return EXIT_OK;
}

} // anonymous namespace

void setup_root(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_root(opts));
    });
}

void setup_join(CLI::App* app, GlobalOptions& opts) {
    static JoinOptions join_opts;

    app->add_option("segments", join_opts.segments, "Path segments")->required();

    app->callback([&opts]() {
        std::exit(cmd_join(opts, join_opts));
    });
}

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("path", check_opts.path, "Path to validate against the root")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace fsgate::cli::commands
