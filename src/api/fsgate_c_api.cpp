/**
 * @file fsgate_c_api.cpp
 * @brief fsgate C API Implementation
 *
 * All C++ exceptions are caught at the boundary and converted to status
 * codes. Error objects are flattened to their message here and nowhere else.
 */

#include "fsgate/fsgate.h"
#include "fsgate/workspace.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#ifndef FSGATE_VERSION_STRING
#define FSGATE_VERSION_STRING "unknown"
#endif

// ============================================================================
// Thread-Local Error State
// ============================================================================

namespace {

thread_local std::string g_last_error;
thread_local FsgateStatus g_last_error_code = FSGATE_OK;

void set_error(FsgateStatus code, const std::string& message) {
    g_last_error_code = code;
    g_last_error = message;
}

void clear_error() {
    g_last_error_code = FSGATE_OK;
    g_last_error.clear();
}

FsgateStatus map_error_code(fsgate::ErrorCode code) {
    switch (code) {
        case fsgate::ErrorCode::INVALID_PATH:
            return FSGATE_ERROR_INVALID_ARGUMENT;
        case fsgate::ErrorCode::BOUNDARY_VIOLATION:
            return FSGATE_ERROR_BOUNDARY_VIOLATION;
        case fsgate::ErrorCode::TRAVERSAL_IN_SUFFIX:
            return FSGATE_ERROR_TRAVERSAL_IN_SUFFIX;
        case fsgate::ErrorCode::FILE_NOT_FOUND:
            return FSGATE_ERROR_NOT_FOUND;
        case fsgate::ErrorCode::PERMISSION_DENIED:
            return FSGATE_ERROR_PERMISSION_DENIED;
        case fsgate::ErrorCode::IO_ERROR:
            return FSGATE_ERROR_IO;
    }
    return FSGATE_ERROR_INTERNAL;
}

FsgateStatus report(const fsgate::Error& error) {
    auto code = map_error_code(error.code());
    set_error(code, error.message());
    return code;
}

// Duplicate a buffer for returning to C caller (caller must free)
char* duplicate_string(const std::string& s) {
    char* result = static_cast<char*>(malloc(s.size() + 1));
    if (result) {
        memcpy(result, s.c_str(), s.size() + 1);
    } else {
        set_error(FSGATE_ERROR_INTERNAL, "out of memory");
    }
    return result;
}

// Run fn, converting any escaping exception into FSGATE_ERROR_INTERNAL
template<typename T, typename F>
T call_guarded(T on_exception, F fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        set_error(FSGATE_ERROR_INTERNAL, e.what());
        return on_exception;
    } catch (...) {
        set_error(FSGATE_ERROR_INTERNAL, "unknown error");
        return on_exception;
    }
}

} // namespace

// ============================================================================
// Opaque Handle Implementations
// ============================================================================

struct FsgateWorkspace {
    std::unique_ptr<fsgate::Workspace> impl;

    explicit FsgateWorkspace(std::unique_ptr<fsgate::Workspace> ws)
        : impl(std::move(ws)) {}
};

struct FsgateStringList {
    std::vector<std::string> strings;
};

extern "C" {

// ============================================================================
// Version
// ============================================================================

FSGATE_CAPI int32_t fsgate_abi_version(void) {
    return FSGATE_ABI_VERSION;
}

FSGATE_CAPI const char* fsgate_version_string(void) {
    return FSGATE_VERSION_STRING;
}

// ============================================================================
// Error Handling
// ============================================================================

FSGATE_CAPI const char* fsgate_get_last_error(void) {
    return g_last_error.c_str();
}

FSGATE_CAPI FsgateStatus fsgate_get_last_error_code(void) {
    return g_last_error_code;
}

FSGATE_CAPI void fsgate_clear_error(void) {
    clear_error();
}

FSGATE_CAPI void fsgate_free_string(char* str) {
    free(str);
}

// ============================================================================
// Workspace Lifecycle
// ============================================================================

FSGATE_CAPI FsgateWorkspace* fsgate_workspace_create(const char* root_path) {
    clear_error();

    return call_guarded<FsgateWorkspace*>(nullptr, [&]() -> FsgateWorkspace* {
        std::string root;
        if (root_path) {
            root = root_path;
        } else {
            std::error_code ec;
            auto cwd = std::filesystem::current_path(ec);
            if (ec) {
                report(fsgate::error_from_errc(ec, "failed to determine current directory"));
                return nullptr;
            }
            root = cwd.string();
        }

        auto ws = fsgate::Workspace::create(root);
        if (ws.isErr()) {
            report(ws.error());
            return nullptr;
        }
        return new FsgateWorkspace(std::move(ws.value()));
    });
}

FSGATE_CAPI void fsgate_workspace_destroy(FsgateWorkspace* ws) {
    delete ws;
}

FSGATE_CAPI const char* fsgate_workspace_root(const FsgateWorkspace* ws) {
    if (!ws) return "";
    return ws->impl->root().c_str();
}

// ============================================================================
// Path Operations
// ============================================================================

FSGATE_CAPI char* fsgate_resolve(const FsgateWorkspace* ws, const char* path) {
    clear_error();

    if (!ws || !path) {
        set_error(FSGATE_ERROR_INVALID_ARGUMENT, ws ? "path is NULL" : "workspace is NULL");
        return nullptr;
    }

    return call_guarded<char*>(nullptr, [&]() -> char* {
        auto result = ws->impl->resolve(path);
        if (result.isErr()) {
            report(result.error());
            return nullptr;
        }
        return duplicate_string(result.value());
    });
}

FSGATE_CAPI char* fsgate_join_path(const char* const* parts, size_t count) {
    clear_error();

    if (!parts && count > 0) {
        set_error(FSGATE_ERROR_INVALID_ARGUMENT, "parts is NULL");
        return nullptr;
    }

    return call_guarded<char*>(nullptr, [&]() -> char* {
        std::vector<std::string> segments;
        segments.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            if (!parts[i]) {
                set_error(FSGATE_ERROR_INVALID_ARGUMENT,
                          "parts[" + std::to_string(i) + "] is NULL");
                return nullptr;
            }
            segments.emplace_back(parts[i]);
        }
        return duplicate_string(fsgate::join_paths(segments));
    });
}

// ============================================================================
// File Operations
// ============================================================================

FSGATE_CAPI char* fsgate_read_text(const FsgateWorkspace* ws, const char* path, size_t* out_len) {
    clear_error();
    if (out_len) *out_len = 0;

    if (!ws || !path) {
        set_error(FSGATE_ERROR_INVALID_ARGUMENT, ws ? "path is NULL" : "workspace is NULL");
        return nullptr;
    }

    return call_guarded<char*>(nullptr, [&]() -> char* {
        auto result = ws->impl->readText(path);
        if (result.isErr()) {
            report(result.error());
            return nullptr;
        }
        char* text = duplicate_string(result.value());
        if (text && out_len) *out_len = result.value().size();
        return text;
    });
}

FSGATE_CAPI FsgateStatus fsgate_write_text(const FsgateWorkspace* ws, const char* path,
                                           const char* content) {
    clear_error();

    if (!ws || !path || !content) {
        set_error(FSGATE_ERROR_INVALID_ARGUMENT,
                  !ws ? "workspace is NULL" : (!path ? "path is NULL" : "content is NULL"));
        return FSGATE_ERROR_INVALID_ARGUMENT;
    }

    return call_guarded<FsgateStatus>(FSGATE_ERROR_INTERNAL, [&]() {
        auto result = ws->impl->writeText(path, content);
        if (result.isErr()) {
            return report(result.error());
        }
        return FSGATE_OK;
    });
}

FSGATE_CAPI FsgateStatus fsgate_write_binary(const FsgateWorkspace* ws, const char* path,
                                             const uint8_t* data, size_t len) {
    clear_error();

    if (!ws || !path || (!data && len > 0)) {
        set_error(FSGATE_ERROR_INVALID_ARGUMENT,
                  !ws ? "workspace is NULL" : (!path ? "path is NULL" : "data is NULL"));
        return FSGATE_ERROR_INVALID_ARGUMENT;
    }

    return call_guarded<FsgateStatus>(FSGATE_ERROR_INTERNAL, [&]() {
        std::vector<uint8_t> bytes;
        if (len > 0) {
            bytes.assign(data, data + len);
        }
        auto result = ws->impl->writeBinary(path, bytes);
        if (result.isErr()) {
            return report(result.error());
        }
        return FSGATE_OK;
    });
}

FSGATE_CAPI FsgateStatus fsgate_delete_file(const FsgateWorkspace* ws, const char* path) {
    clear_error();

    if (!ws || !path) {
        set_error(FSGATE_ERROR_INVALID_ARGUMENT, ws ? "path is NULL" : "workspace is NULL");
        return FSGATE_ERROR_INVALID_ARGUMENT;
    }

    return call_guarded<FsgateStatus>(FSGATE_ERROR_INTERNAL, [&]() {
        auto result = ws->impl->deleteFile(path);
        if (result.isErr()) {
            return report(result.error());
        }
        return FSGATE_OK;
    });
}

FSGATE_CAPI FsgateStringList* fsgate_list_files(const FsgateWorkspace* ws, const char* path) {
    clear_error();

    if (!ws || !path) {
        set_error(FSGATE_ERROR_INVALID_ARGUMENT, ws ? "path is NULL" : "workspace is NULL");
        return nullptr;
    }

    return call_guarded<FsgateStringList*>(nullptr, [&]() -> FsgateStringList* {
        auto result = ws->impl->listFiles(path);
        if (result.isErr()) {
            report(result.error());
            return nullptr;
        }
        auto list = new FsgateStringList();
        list->strings = std::move(result.value());
        return list;
    });
}

// ============================================================================
// String List Accessors
// ============================================================================

FSGATE_CAPI int32_t fsgate_string_list_count(const FsgateStringList* list) {
    if (!list) return 0;
    return static_cast<int32_t>(list->strings.size());
}

FSGATE_CAPI const char* fsgate_string_list_get(const FsgateStringList* list, int32_t index) {
    if (!list || index < 0 || static_cast<size_t>(index) >= list->strings.size()) {
        return nullptr;
    }
    return list->strings[static_cast<size_t>(index)].c_str();
}

FSGATE_CAPI void fsgate_string_list_destroy(FsgateStringList* list) {
    delete list;
}

} // extern "C"
