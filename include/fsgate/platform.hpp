#pragma once

#include "fsgate/export.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fsgate {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The temp file lives beside the target, so the rename never crosses devices.
FSGATE_API AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
FSGATE_API AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Create a directory and its missing parents (fsync on the parent).
// Succeeds if the directory already exists.
FSGATE_API AtomicWriteResult atomic_create_directory(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
FSGATE_API std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
FSGATE_API std::string get_parent_directory(const std::string& path);

// Get the filename from a path
FSGATE_API std::string get_filename(const std::string& path);

// ============================================================================
// Text
// ============================================================================

// Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF
FSGATE_API bool is_valid_utf8(const std::string& s);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
FSGATE_API std::optional<std::string> get_env(const std::string& name);

// Generate a UUID string
FSGATE_API std::string generate_uuid();

} // namespace fsgate
