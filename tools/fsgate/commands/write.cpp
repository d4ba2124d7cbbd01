/**
 * fsgate CLI - write and write-binary commands
 *
 * Text comes from --text or stdin; bytes come from --input or stdin.
 * Missing parent directories are created.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

namespace fsgate::cli::commands {

namespace {

struct WriteOptions {
    std::string path;
    std::string text;
    bool has_text = false;
};

struct WriteBinaryOptions {
    std::string path;
    std::string input;
};

std::string read_stdin_text() {
    std::stringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

std::optional<std::vector<uint8_t>> read_bytes(const std::string& input) {
    if (input.empty() || input == "-") {
#ifdef _WIN32
        _setmode(_fileno(stdin), _O_BINARY);
#endif
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(std::cin),
                                    std::istreambuf_iterator<char>());
    }

    std::ifstream file(input, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

int cmd_write(const GlobalOptions& opts, const WriteOptions& write_opts) {
    auto ws = open_workspace(opts);
    if (!ws) {
        return EXIT_NO_ROOT;
    }

    std::string content = write_opts.has_text ? write_opts.text : read_stdin_text();

    auto result = ws->writeText(write_opts.path, content);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return EXIT_FAILED;
    }

    print_success("Wrote " + std::to_string(content.size()) + " bytes to " + write_opts.path, opts);
    return EXIT_OK;
}

int cmd_write_binary(const GlobalOptions& opts, const WriteBinaryOptions& bin_opts) {
    auto ws = open_workspace(opts);
    if (!ws) {
        return EXIT_NO_ROOT;
    }

    auto bytes = read_bytes(bin_opts.input);
    if (!bytes) {
        print_error("cannot open input file: " + bin_opts.input, opts.json);
        return EXIT_FAILED;
    }

    auto result = ws->writeBinary(bin_opts.path, *bytes);
    if (result.isErr()) {
        print_error(result.error(), opts.json);
        return EXIT_FAILED;
    }

    print_success("Wrote " + std::to_string(bytes->size()) + " bytes to " + bin_opts.path, opts);
    return EXIT_OK;
}

} // anonymous namespace

void setup_write(CLI::App* app, GlobalOptions& opts) {
    static WriteOptions write_opts;

    app->add_option("path", write_opts.path, "File to write")->required();
    auto* text_opt = app->add_option("--text", write_opts.text, "Content to write (default: read stdin)");

    app->callback([&opts, text_opt]() {
        write_opts.has_text = text_opt->count() > 0;
        std::exit(cmd_write(opts, write_opts));
    });
}

void setup_write_binary(CLI::App* app, GlobalOptions& opts) {
    static WriteBinaryOptions bin_opts;

    app->add_option("path", bin_opts.path, "File to write")->required();
    app->add_option("-i,--input", bin_opts.input, "Source file (default: read stdin)");

    app->callback([&opts]() {
        std::exit(cmd_write_binary(opts, bin_opts));
    });
}

} // namespace fsgate::cli::commands
