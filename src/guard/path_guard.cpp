#include "fsgate/path_guard.hpp"
#include "fsgate/platform.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fsgate {

namespace fs = std::filesystem;

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

// Non-empty components of a path ("/a/b/" -> "/", "a", "b")
std::vector<fs::path> components_of(const fs::path& p) {
    std::vector<fs::path> comps;
    for (const auto& part : p) {
        if (!part.empty()) comps.push_back(part);
    }
    return comps;
}

// Join candidate to root and drop empty and "." segments. ".." is kept:
// it can only be interpreted once we know which prefix exists on disk.
fs::path resolve_candidate(const std::string& root, const std::string& candidate) {
    fs::path joined = fs::path(root) / fs::path(candidate);
    fs::path out;
    for (const auto& part : joined) {
        if (part.empty() || part == ".") continue;
        out /= part;
    }
    return out;
}

bool entry_exists(const fs::path& p) {
    std::error_code ec;
    auto st = fs::symlink_status(p, ec);
    return !ec && fs::exists(st);
}

} // namespace

Result<std::string> validate_path(const std::string& root, const std::string& candidate) {
    if (contains_nul(candidate)) {
        return Result<std::string>::err(
            Error(ErrorCode::INVALID_PATH, "path contains NUL byte"));
    }

    fs::path resolved = resolve_candidate(root, candidate);

    // Walk upward to the longest prefix that exists.
    fs::path existing = resolved;
    while (!entry_exists(existing)) {
        fs::path parent = existing.parent_path();
        if (parent.empty() || parent == existing) {
            return Result<std::string>::err(
                Error(ErrorCode::IO_ERROR, "no existing ancestor for path: " + candidate));
        }
        existing = parent;
    }

    std::error_code ec;
    fs::path canonical_ancestor = fs::canonical(existing, ec);
    if (ec) {
        return Result<std::string>::err(
            error_from_errc(ec, "failed to canonicalize " + to_portable_path(existing.string())));
    }

    if (!is_within_root(root, canonical_ancestor.string())) {
        return Result<std::string>::err(
            Error(ErrorCode::BOUNDARY_VIOLATION,
                  "path escapes root " + root + ": " + candidate));
    }

    auto resolved_comps = components_of(resolved);
    size_t existing_count = components_of(existing).size();
    for (size_t i = existing_count; i < resolved_comps.size(); ++i) {
        if (resolved_comps[i] == "..") {
            return Result<std::string>::err(
                Error(ErrorCode::TRAVERSAL_IN_SUFFIX,
                      "parent directory reference in non-existent part of path: " + candidate));
        }
    }

    return Result<std::string>::ok(to_portable_path(resolved.string()));
}

bool is_within_root(const std::string& root, const std::string& path) {
    auto root_comps = components_of(fs::path(root).lexically_normal());
    auto path_comps = components_of(fs::path(path).lexically_normal());

    if (root_comps.size() > path_comps.size()) {
        return false;
    }
    for (size_t i = 0; i < root_comps.size(); ++i) {
        if (root_comps[i] != path_comps[i]) {
            return false;
        }
    }
    return true;
}

Result<std::string> canonicalize_root(const std::string& path) {
    if (path.empty()) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_PATH, "root path is empty"));
    }
    if (contains_nul(path)) {
        return Result<std::string>::err(
            Error(ErrorCode::INVALID_PATH, "root path contains NUL byte"));
    }

    std::error_code ec;
    fs::path canonical = fs::canonical(path, ec);
    if (ec) {
        return Result<std::string>::err(error_from_errc(ec, "failed to resolve root " + path));
    }
    if (!fs::is_directory(canonical, ec)) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "root is not a directory: " + canonical.string()));
    }

    return Result<std::string>::ok(to_portable_path(canonical.string()));
}

} // namespace fsgate
