#pragma once

#include "fsgate/export.hpp"
#include "fsgate/result.hpp"

#include <string>

namespace fsgate {

// Resolve an untrusted path against a canonical root, or reject it.
// - Rejects NUL bytes (INVALID_PATH)
// - Relative candidates are joined to root; absolute ones are taken as-is
// - The longest existing prefix is canonicalized (symlinks and ".." resolved)
//   and must lie inside root (BOUNDARY_VIOLATION)
// - The non-existing remainder must not contain ".." (TRAVERSAL_IN_SUFFIX)
// - Canonicalization failures carry the I/O error text
// On success returns the resolved absolute path. Only empty and "." segments
// are removed from it; the non-existing remainder is not canonicalized.
//
// root must already be canonical (see canonicalize_root).
FSGATE_API Result<std::string> validate_path(const std::string& root,
                                             const std::string& candidate);

// Component-wise containment: true if path equals root or lies below it.
// Purely lexical; both arguments should be canonical.
FSGATE_API bool is_within_root(const std::string& root, const std::string& path);

// Canonicalize a directory to be used as a root.
// Fails if the path does not exist, cannot be resolved, or is not a directory.
FSGATE_API Result<std::string> canonicalize_root(const std::string& path);

} // namespace fsgate
