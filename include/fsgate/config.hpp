#pragma once

#include "fsgate/export.hpp"
#include "fsgate/result.hpp"

#include <spdlog/common.h>

#include <optional>
#include <string>

namespace fsgate {

// ============================================================================
// Workspace Configuration
// ============================================================================

inline constexpr const char* CONFIG_SCHEMA = "fsgate.config.v1";

struct WorkspaceConfig {
    std::string root;        // empty: not configured
    std::string log_level;   // empty: not configured
    std::string source_path;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    WorkspaceConfig config;
};

// Parse a config document:
//   { "$schema": "fsgate.config.v1", "root": "/work", "log_level": "debug" }
// All keys are optional; unknown keys are ignored.
FSGATE_API ConfigParseResult parse_workspace_config(const std::string& json_str,
                                                    const std::string& source_path = "");

// Read and parse a config file
FSGATE_API ConfigParseResult load_workspace_config(const std::string& path);

// Map a level name ("trace" ... "off") to an spdlog level
FSGATE_API std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

/**
 * Resolve the root directory for a Workspace.
 * Priority: explicit override > FSGATE_ROOT env > config "root" > current directory.
 * The result is not canonicalized; Workspace::create does that once.
 */
FSGATE_API Result<std::string> resolve_workspace_root(const std::optional<std::string>& override_root,
                                                      const WorkspaceConfig& config);

/**
 * Resolve the log level.
 * Priority: explicit override > FSGATE_LOG_LEVEL env > config "log_level" > info.
 * Unknown names fall through to the next source.
 */
FSGATE_API spdlog::level::level_enum resolve_log_level(
    const std::optional<spdlog::level::level_enum>& override_level,
    const WorkspaceConfig& config);

} // namespace fsgate
