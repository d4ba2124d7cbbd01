/**
 * fsgate CLI - Common utilities and types
 */

#pragma once

#include <fsgate/config.hpp>
#include <fsgate/workspace.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace fsgate::cli {

// Exit statuses
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_NO_ROOT = 2;

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Output utilities.
 */
inline void print_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.message();
        j["code"] = error_code_name(error.code());
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << error.message() << std::endl;
    }
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

// Print {"ok": true} in JSON mode, or msg otherwise (unless quiet)
inline void print_success(const std::string& msg, const GlobalOptions& opts) {
    if (opts.json) {
        output_json({{"ok", true}});
    } else if (!opts.quiet && !msg.empty()) {
        std::cout << msg << std::endl;
    }
}

/**
 * Route logging to stderr so stdout stays clean for file contents and JSON.
 */
inline void init_logging(const GlobalOptions& opts, const WorkspaceConfig& config) {
    auto logger = spdlog::stderr_color_mt("fsgate");
    spdlog::set_default_logger(logger);

    std::optional<spdlog::level::level_enum> override_level;
    if (opts.verbose) {
        override_level = spdlog::level::debug;
    } else if (opts.quiet) {
        override_level = spdlog::level::err;
    }
    spdlog::set_level(resolve_log_level(override_level, config));
}

/**
 * Load configuration, set up logging and establish the workspace root.
 * Returns nullptr (after printing the reason) when no root can be established.
 */
inline std::unique_ptr<Workspace> open_workspace(const GlobalOptions& opts) {
    WorkspaceConfig config;
    if (!opts.config.empty()) {
        auto loaded = load_workspace_config(opts.config);
        if (!loaded.ok) {
            print_error(opts.config + ": " + loaded.error, opts.json);
            return nullptr;
        }
        config = loaded.config;
    }

    init_logging(opts, config);

    auto root = resolve_workspace_root(
        opts.root.empty() ? std::nullopt : std::make_optional(opts.root), config);
    if (root.isErr()) {
        print_error(root.error(), opts.json);
        return nullptr;
    }

    auto ws = Workspace::create(root.value());
    if (ws.isErr()) {
        print_error(ws.error(), opts.json);
        return nullptr;
    }
    return std::move(ws.value());
}

} // namespace fsgate::cli
