#include "fsgate/config.hpp"
#include "fsgate/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace fsgate {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Returns false when the key is present but not a string
bool read_string(const nlohmann::json& j, const std::string& key, std::string& out) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_string()) {
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

} // namespace

ConfigParseResult parse_workspace_config(const std::string& json_str,
                                         const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        std::string schema;
        if (!read_string(j, "$schema", schema)) {
            result.error = "$schema must be a string";
            return result;
        }
        if (!schema.empty() && trim(schema) != CONFIG_SCHEMA) {
            result.error = "unsupported $schema: " + schema;
            return result;
        }

        if (!read_string(j, "root", result.config.root)) {
            result.error = "root must be a string";
            return result;
        }

        std::string level;
        if (!read_string(j, "log_level", level)) {
            result.error = "log_level must be a string";
            return result;
        }
        level = to_lower(trim(level));
        if (!level.empty() && !parse_log_level(level)) {
            result.error = "unknown log_level: " + level;
            return result;
        }
        result.config.log_level = level;

        result.ok = true;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

ConfigParseResult load_workspace_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        ConfigParseResult result;
        result.error = "cannot open config file: " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return parse_workspace_config(ss.str(), path);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string lowered = to_lower(trim(name));
    if (lowered.empty()) {
        return std::nullopt;
    }
    if (lowered == "off") {
        return spdlog::level::off;
    }
    // from_str() maps anything it does not know to off
    auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off) {
        return std::nullopt;
    }
    return level;
}

Result<std::string> resolve_workspace_root(const std::optional<std::string>& override_root,
                                           const WorkspaceConfig& config) {
    if (override_root && !override_root->empty()) {
        return Result<std::string>::ok(*override_root);
    }

    auto env_root = get_env("FSGATE_ROOT");
    if (env_root && !env_root->empty()) {
        return Result<std::string>::ok(*env_root);
    }

    if (!config.root.empty()) {
        // Relative roots in a config file are taken relative to the file
        std::filesystem::path configured(config.root);
        if (configured.is_relative() && !config.source_path.empty()) {
            configured = std::filesystem::path(config.source_path).parent_path() / configured;
        }
        return Result<std::string>::ok(to_portable_path(configured.string()));
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return Result<std::string>::err(
            error_from_errc(ec, "failed to determine current directory"));
    }
    return Result<std::string>::ok(to_portable_path(cwd.string()));
}

spdlog::level::level_enum resolve_log_level(
    const std::optional<spdlog::level::level_enum>& override_level,
    const WorkspaceConfig& config) {
    if (override_level) {
        return *override_level;
    }

    if (auto env_level = get_env("FSGATE_LOG_LEVEL")) {
        if (auto level = parse_log_level(*env_level)) {
            return *level;
        }
    }

    if (auto level = parse_log_level(config.log_level)) {
        return *level;
    }

    return spdlog::level::info;
}

} // namespace fsgate
