#pragma once

/**
 * @file workspace.hpp
 * @brief Root-confined file operations
 *
 * A Workspace owns one canonical root directory. Every accessor runs the
 * caller's path through validate_path() before touching the filesystem.
 *
 * @example
 * ```cpp
 * #include <fsgate/workspace.hpp>
 *
 * auto ws = fsgate::Workspace::create("/work");
 * if (ws.isErr()) {
 *     // Fatal: there is no boundary to enforce
 * }
 * auto text = ws.value()->readText("notes/today.md");
 * if (text.isOk()) {
 *     // Use text.value()
 * }
 * ```
 */

#include "fsgate/export.hpp"
#include "fsgate/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fsgate {

class FSGATE_API Workspace {
public:
    /**
     * @brief Create a Workspace confined to a root directory
     * @param root_path Existing directory; canonicalized once here
     * @return Workspace or the error that prevented establishing the root
     */
    static Result<std::unique_ptr<Workspace>> create(const std::string& root_path);

    /// Canonical root path
    const std::string& root() const { return root_; }

    /// Run a path through the guard without touching its target
    Result<std::string> resolve(const std::string& path) const;

    /// Read an entire file as UTF-8 text
    Result<std::string> readText(const std::string& path) const;

    /// Write text, creating missing parent directories
    Result<void> writeText(const std::string& path, const std::string& content) const;

    /// Write raw bytes, creating missing parent directories
    Result<void> writeBinary(const std::string& path, const std::vector<uint8_t>& content) const;

    /**
     * @brief List the regular files directly inside a directory
     *
     * Subdirectories are skipped; symlinks to files are included. Order is
     * whatever the directory enumeration yields.
     */
    Result<std::vector<std::string>> listFiles(const std::string& path) const;

    /// Delete a single file (directories are refused)
    Result<void> deleteFile(const std::string& path) const;

private:
    explicit Workspace(std::string root) : root_(std::move(root)) {}

    Result<std::string> guard(const char* operation, const std::string& path) const;
    Result<void> writeBytes(const char* operation, const std::string& path,
                            const std::vector<uint8_t>& content) const;

    std::string root_;
};

// Join path segments with the platform separator. Pure string building:
// no guard, no filesystem access. An absolute segment restarts the path.
FSGATE_API std::string join_paths(const std::vector<std::string>& segments);

} // namespace fsgate
