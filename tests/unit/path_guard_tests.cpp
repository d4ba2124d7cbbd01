#include <doctest/doctest.h>
#include <fsgate/path_guard.hpp>
#include <fsgate/workspace.hpp>

#include "../temp_root.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using fsgate::ErrorCode;
using fsgate::is_within_root;
using fsgate::validate_path;

namespace {

// sandbox/
//   work/          <- root
//     logs/
//     notes/a.md
//   work2/
//   outside/secret.txt
struct GuardFixture {
    TempRoot sandbox;
    std::string root;

    GuardFixture() {
        sandbox.mkdir("work/logs");
        sandbox.write("work/notes/a.md", "# a");
        sandbox.mkdir("work2");
        sandbox.write("outside/secret.txt", "secret");
        root = sandbox.sub("work");
    }
};

} // namespace

// ============================================================================
// Approval
// ============================================================================

TEST_CASE("empty and dot resolve to the root itself") {
    GuardFixture f;

    auto empty = validate_path(f.root, "");
    REQUIRE(empty.isOk());
    CHECK(empty.value() == f.root);

    auto dot = validate_path(f.root, ".");
    REQUIRE(dot.isOk());
    CHECK(dot.value() == f.root);

    auto dot_slash = validate_path(f.root, "./");
    REQUIRE(dot_slash.isOk());
    CHECK(dot_slash.value() == f.root);
}

TEST_CASE("non-existent relative path is approved and joined to root") {
    GuardFixture f;

    auto r = validate_path(f.root, "logs/app.log");
    REQUIRE(r.isOk());
    CHECK(r.value() == f.root + "/logs/app.log");

    auto deep = validate_path(f.root, "new/deeper/still/file.txt");
    REQUIRE(deep.isOk());
    CHECK(deep.value() == f.root + "/new/deeper/still/file.txt");
}

TEST_CASE("existing file inside root is approved") {
    GuardFixture f;

    auto r = validate_path(f.root, "notes/a.md");
    REQUIRE(r.isOk());
    CHECK(r.value() == f.root + "/notes/a.md");
}

TEST_CASE("absolute path inside root is approved verbatim") {
    GuardFixture f;

    auto r = validate_path(f.root, f.root + "/notes/a.md");
    REQUIRE(r.isOk());
    CHECK(r.value() == f.root + "/notes/a.md");
}

TEST_CASE("joined segments validate to root/a/b/c") {
    GuardFixture f;

    auto joined = fsgate::join_paths({"a", "b", "c"});
    auto r = validate_path(f.root, joined);
    REQUIRE(r.isOk());
    CHECK(r.value() == f.root + "/a/b/c");
}

TEST_CASE("dot and empty segments are dropped") {
    GuardFixture f;

    auto r = validate_path(f.root, "./logs//./app.log");
    REQUIRE(r.isOk());
    CHECK(r.value() == f.root + "/logs/app.log");
}

TEST_CASE("dotdot inside an existing prefix may cancel out") {
    GuardFixture f;

    SUBCASE("back into the same directory") {
        auto r = validate_path(f.root, "logs/../logs/app.log");
        REQUIRE(r.isOk());
        // The returned path is not canonicalized
        CHECK(r.value() == f.root + "/logs/../logs/app.log");
    }

    SUBCASE("back to the root") {
        auto r = validate_path(f.root, "logs/..");
        CHECK(r.isOk());
    }

    SUBCASE("into a sibling that exists") {
        auto r = validate_path(f.root, "logs/../notes/a.md");
        CHECK(r.isOk());
    }
}

TEST_CASE("validation is deterministic") {
    GuardFixture f;

    auto a = validate_path(f.root, "../outside/secret.txt");
    auto b = validate_path(f.root, "../outside/secret.txt");
    REQUIRE(a.isErr());
    REQUIRE(b.isErr());
    CHECK(a.error().code() == b.error().code());
    CHECK(a.error().message() == b.error().message());
}

// ============================================================================
// Boundary violations
// ============================================================================

TEST_CASE("absolute path outside root is rejected whether or not it exists") {
    GuardFixture f;

    SUBCASE("existing file") {
        auto r = validate_path(f.root, f.sandbox.sub("outside/secret.txt"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::BOUNDARY_VIOLATION);
    }

    SUBCASE("non-existent file") {
        auto r = validate_path(f.root, f.sandbox.sub("outside/missing/new.txt"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::BOUNDARY_VIOLATION);
    }

    SUBCASE("filesystem root") {
        auto r = validate_path(f.root, "/");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::BOUNDARY_VIOLATION);
    }
}

TEST_CASE("leading dotdot escapes through the existing parent") {
    GuardFixture f;

    SUBCASE("to an existing file") {
        auto r = validate_path(f.root, "../outside/secret.txt");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::BOUNDARY_VIOLATION);
    }

    SUBCASE("to a missing file") {
        auto r = validate_path(f.root, "../escape.txt");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::BOUNDARY_VIOLATION);
    }

    SUBCASE("through an existing subdirectory") {
        auto r = validate_path(f.root, "logs/../../escape.txt");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::BOUNDARY_VIOLATION);
    }
}

TEST_CASE("sibling directory sharing the root's name prefix is outside") {
    GuardFixture f;

    auto r = validate_path(f.root, f.sandbox.sub("work2/file.txt"));
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::BOUNDARY_VIOLATION);
}

// ============================================================================
// Traversal in the non-existent suffix
// ============================================================================

TEST_CASE("dotdot in the non-existent suffix is rejected") {
    GuardFixture f;

    SUBCASE("escaping") {
        auto r = validate_path(f.root, "newdir/../../escape.txt");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::TRAVERSAL_IN_SUFFIX);
    }

    SUBCASE("even when it would stay inside") {
        auto r = validate_path(f.root, "newdir/../inside.txt");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::TRAVERSAL_IN_SUFFIX);
    }

    SUBCASE("after an existing prefix") {
        auto r = validate_path(f.root, "logs/new/../../../escape.txt");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::TRAVERSAL_IN_SUFFIX);
    }
}

TEST_CASE("each rejection kind has its own message") {
    GuardFixture f;

    auto boundary = validate_path(f.root, "../escape.txt");
    auto traversal = validate_path(f.root, "newdir/../../escape.txt");
    REQUIRE(boundary.isErr());
    REQUIRE(traversal.isErr());
    CHECK(boundary.error().message() != traversal.error().message());
    CHECK(boundary.error().message().find("escapes root") != std::string::npos);
    CHECK(traversal.error().message().find("parent directory") != std::string::npos);
}

// ============================================================================
// Invalid input
// ============================================================================

TEST_CASE("NUL bytes are rejected") {
    GuardFixture f;

    std::string bad = std::string("notes/\0a.md", 11);
    auto r = validate_path(f.root, bad);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::INVALID_PATH);
}

// ============================================================================
// Symlinks
// ============================================================================

#ifndef _WIN32
TEST_CASE("symlinks in the existing prefix are resolved before the check") {
    GuardFixture f;

    SUBCASE("link pointing outside is rejected") {
        fs::create_directory_symlink(f.sandbox.sub("outside"), f.sandbox.sub("work/escape"));

        auto existing = validate_path(f.root, "escape/secret.txt");
        REQUIRE(existing.isErr());
        CHECK(existing.error().code() == ErrorCode::BOUNDARY_VIOLATION);

        auto created = validate_path(f.root, "escape/new.txt");
        REQUIRE(created.isErr());
        CHECK(created.error().code() == ErrorCode::BOUNDARY_VIOLATION);
    }

    SUBCASE("file link pointing outside is rejected") {
        fs::create_symlink(f.sandbox.sub("outside/secret.txt"), f.sandbox.sub("work/secret.txt"));

        auto r = validate_path(f.root, "secret.txt");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::BOUNDARY_VIOLATION);
    }

    SUBCASE("link pointing inside is approved") {
        fs::create_directory_symlink(f.sandbox.sub("work/notes"), f.sandbox.sub("work/alias"));

        auto r = validate_path(f.root, "alias/a.md");
        REQUIRE(r.isOk());
        CHECK(r.value() == f.root + "/alias/a.md");
    }

    SUBCASE("dotdot after a link is resolved physically") {
        f.sandbox.mkdir("outside/deep");
        fs::create_directory_symlink(f.sandbox.sub("outside/deep"), f.sandbox.sub("work/deep"));

        // work/deep/.. is outside/, not work/
        auto r = validate_path(f.root, "deep/../secret.txt");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::BOUNDARY_VIOLATION);
    }

    SUBCASE("dangling link fails canonicalization") {
        fs::create_symlink(f.sandbox.sub("nowhere/target"), f.sandbox.sub("work/dangling"));

        auto r = validate_path(f.root, "dangling");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::FILE_NOT_FOUND);
        CHECK(r.error().message().find("failed to canonicalize") != std::string::npos);

        auto below = validate_path(f.root, "dangling/child.txt");
        REQUIRE(below.isErr());
        CHECK(below.error().code() == ErrorCode::FILE_NOT_FOUND);
    }

    SUBCASE("symlinked root path is accepted once canonicalized") {
        fs::create_directory_symlink(f.root, f.sandbox.sub("work_link"));

        auto canonical = fsgate::canonicalize_root(f.sandbox.sub("work_link"));
        REQUIRE(canonical.isOk());
        CHECK(canonical.value() == f.root);

        auto r = validate_path(canonical.value(), f.sandbox.sub("work_link/notes/a.md"));
        CHECK(r.isOk());
    }
}
#endif

// ============================================================================
// Containment predicate
// ============================================================================

TEST_CASE("is_within_root compares whole components") {
    CHECK(is_within_root("/work", "/work"));
    CHECK(is_within_root("/work", "/work/a"));
    CHECK(is_within_root("/work", "/work/a/b.txt"));
    CHECK(is_within_root("/work/", "/work/a"));
    CHECK(is_within_root("/", "/etc"));

    CHECK_FALSE(is_within_root("/work", "/work2"));
    CHECK_FALSE(is_within_root("/work", "/wor"));
    CHECK_FALSE(is_within_root("/work", "/"));
    CHECK_FALSE(is_within_root("/work/a", "/work"));
    CHECK_FALSE(is_within_root("/work", "/other/work"));
}

// ============================================================================
// Root canonicalization
// ============================================================================

TEST_CASE("canonicalize_root") {
    TempRoot sandbox;
    sandbox.write("file.txt", "x");

    SUBCASE("existing directory") {
        auto r = fsgate::canonicalize_root(sandbox.path());
        REQUIRE(r.isOk());
        CHECK(r.value() == sandbox.path());
    }

    SUBCASE("dot segments are removed") {
        sandbox.mkdir("sub");
        auto r = fsgate::canonicalize_root(sandbox.path() + "/sub/./..");
        REQUIRE(r.isOk());
        CHECK(r.value() == sandbox.path());
    }

    SUBCASE("missing directory") {
        auto r = fsgate::canonicalize_root(sandbox.sub("missing"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::FILE_NOT_FOUND);
    }

    SUBCASE("regular file") {
        auto r = fsgate::canonicalize_root(sandbox.sub("file.txt"));
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::IO_ERROR);
    }

    SUBCASE("empty path") {
        auto r = fsgate::canonicalize_root("");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::INVALID_PATH);
    }
}
