/**
 * @file fsgate.h
 * @brief fsgate C API - root-confined file operations for host applications
 *
 * ## Design Principles
 *
 * 1. **Opaque handles**: FsgateWorkspace and FsgateStringList are pointers to
 *    opaque structs.
 *
 * 2. **Ownership**: Functions returning `char*` return newly allocated
 *    strings that the caller must free with `fsgate_free_string()`.
 *    Functions returning `const char*` return borrowed pointers valid
 *    only while the parent handle is alive.
 *
 * 3. **Error handling**: Fallible operations return a status code or NULL.
 *    Use `fsgate_get_last_error()` for the message. Errors are thread-local.
 *
 * 4. **No exceptions**: The C++ implementation catches all exceptions
 *    and converts them to error codes.
 *
 * ## Example
 *
 * ```c
 * #include <fsgate/fsgate.h>
 * #include <stdio.h>
 *
 * int main(void) {
 *     FsgateWorkspace* ws = fsgate_workspace_create(NULL);  // current directory
 *     if (!ws) {
 *         fprintf(stderr, "Error: %s\n", fsgate_get_last_error());
 *         return 1;
 *     }
 *
 *     if (fsgate_write_text(ws, "notes/today.md", "# Today\n") != FSGATE_OK) {
 *         fprintf(stderr, "Error: %s\n", fsgate_get_last_error());
 *     }
 *
 *     char* text = fsgate_read_text(ws, "notes/today.md", NULL);
 *     if (text) {
 *         printf("%s", text);
 *         fsgate_free_string(text);
 *     }
 *
 *     fsgate_workspace_destroy(ws);
 *     return 0;
 * }
 * ```
 *
 * ## Thread Safety
 *
 * A workspace handle holds only its immutable root and may be shared
 * between threads. `fsgate_get_last_error()` is thread-local.
 */

#ifndef FSGATE_H
#define FSGATE_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

#define FSGATE_ABI_VERSION 1

/* ============================================================================
 * Export Macros
 * ============================================================================ */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef FSGATE_BUILDING_SHARED
        #define FSGATE_CAPI __declspec(dllexport)
    #elif defined(FSGATE_SHARED)
        #define FSGATE_CAPI __declspec(dllimport)
    #else
        #define FSGATE_CAPI
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef FSGATE_BUILDING_SHARED
        #define FSGATE_CAPI __attribute__((visibility("default")))
    #else
        #define FSGATE_CAPI
    #endif
#else
    #define FSGATE_CAPI
#endif

/* ============================================================================
 * Opaque Handle Types
 * ============================================================================ */

/** @brief Opaque handle to a root-confined workspace */
typedef struct FsgateWorkspace FsgateWorkspace;

/** @brief Opaque handle to a string list */
typedef struct FsgateStringList FsgateStringList;

/* ============================================================================
 * Status Codes
 * ============================================================================ */

typedef enum FsgateStatus {
    FSGATE_OK = 0,
    FSGATE_ERROR_INVALID_ARGUMENT = 1,
    FSGATE_ERROR_BOUNDARY_VIOLATION = 2,
    FSGATE_ERROR_TRAVERSAL_IN_SUFFIX = 3,
    FSGATE_ERROR_NOT_FOUND = 4,
    FSGATE_ERROR_PERMISSION_DENIED = 5,
    FSGATE_ERROR_IO = 6,
    FSGATE_ERROR_INTERNAL = 99
} FsgateStatus;

/* ============================================================================
 * Version
 * ============================================================================ */

/** @brief ABI version of the loaded library (compare with FSGATE_ABI_VERSION) */
FSGATE_CAPI int32_t fsgate_abi_version(void);

/** @brief Library version string. Pointer is valid for program lifetime. */
FSGATE_CAPI const char* fsgate_version_string(void);

/* ============================================================================
 * Error Handling
 * ============================================================================ */

/**
 * @brief Get the last error message (thread-local)
 * @return Error message, or empty string if the last call succeeded.
 *         Pointer valid until the next fsgate call on this thread.
 */
FSGATE_CAPI const char* fsgate_get_last_error(void);

/** @brief Get the last error code (thread-local) */
FSGATE_CAPI FsgateStatus fsgate_get_last_error_code(void);

/** @brief Clear the last error (thread-local) */
FSGATE_CAPI void fsgate_clear_error(void);

/* ============================================================================
 * Memory Management
 * ============================================================================ */

/** @brief Free a string returned by fsgate functions (NULL is safe) */
FSGATE_CAPI void fsgate_free_string(char* str);

/* ============================================================================
 * Workspace Lifecycle
 * ============================================================================ */

/**
 * @brief Create a workspace confined to a root directory
 * @param root_path Existing directory, or NULL for the current working directory
 * @return Workspace handle, or NULL if the root cannot be established
 *
 * The root is canonicalized once here and never re-derived afterwards.
 */
FSGATE_CAPI FsgateWorkspace* fsgate_workspace_create(const char* root_path);

/** @brief Destroy a workspace (NULL is safe) */
FSGATE_CAPI void fsgate_workspace_destroy(FsgateWorkspace* ws);

/**
 * @brief Canonical root of a workspace
 * @return Root path, or "" for NULL. Pointer valid while the workspace is alive.
 */
FSGATE_CAPI const char* fsgate_workspace_root(const FsgateWorkspace* ws);

/* ============================================================================
 * Path Operations
 * ============================================================================ */

/**
 * @brief Validate a path against the workspace root
 * @return Approved absolute path (caller frees), or NULL on rejection
 */
FSGATE_CAPI char* fsgate_resolve(const FsgateWorkspace* ws, const char* path);

/**
 * @brief Join path segments (pure; no validation, no filesystem access)
 * @param parts Array of segments; NULL entries are an error
 * @param count Number of segments
 * @return Joined path (caller frees), or NULL on invalid arguments
 */
FSGATE_CAPI char* fsgate_join_path(const char* const* parts, size_t count);

/* ============================================================================
 * File Operations
 * ============================================================================ */

/**
 * @brief Read a UTF-8 text file
 * @param out_len Optional; receives the length in bytes
 * @return File contents (caller frees), or NULL on error
 */
FSGATE_CAPI char* fsgate_read_text(const FsgateWorkspace* ws, const char* path, size_t* out_len);

/** @brief Write a NUL-terminated string, creating parent directories */
FSGATE_CAPI FsgateStatus fsgate_write_text(const FsgateWorkspace* ws, const char* path,
                                           const char* content);

/** @brief Write bytes, creating parent directories (data may be NULL when len is 0) */
FSGATE_CAPI FsgateStatus fsgate_write_binary(const FsgateWorkspace* ws, const char* path,
                                             const uint8_t* data, size_t len);

/** @brief Delete a file */
FSGATE_CAPI FsgateStatus fsgate_delete_file(const FsgateWorkspace* ws, const char* path);

/**
 * @brief List regular files directly inside a directory
 * @return String list handle (destroy with fsgate_string_list_destroy), or NULL
 */
FSGATE_CAPI FsgateStringList* fsgate_list_files(const FsgateWorkspace* ws, const char* path);

/* ============================================================================
 * String List Accessors
 * ============================================================================ */

FSGATE_CAPI int32_t fsgate_string_list_count(const FsgateStringList* list);

/** @return Borrowed string, or NULL if out of range */
FSGATE_CAPI const char* fsgate_string_list_get(const FsgateStringList* list, int32_t index);

FSGATE_CAPI void fsgate_string_list_destroy(FsgateStringList* list);

#ifdef __cplusplus
}
#endif

#endif /* FSGATE_H */
