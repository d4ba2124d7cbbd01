#include <doctest/doctest.h>
#include <fsgate/config.hpp>

#include "../temp_root.hpp"

#include <cstdlib>
#include <filesystem>

using namespace fsgate;

namespace {

#ifndef _WIN32
// Sets an environment variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (old_) {
            setenv(name_.c_str(), old_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> old_;
};
#endif

} // namespace

TEST_CASE("parse_workspace_config") {
    SUBCASE("full document") {
        auto r = parse_workspace_config(R"({
            "$schema": "fsgate.config.v1",
            "root": "/work",
            "log_level": "Debug"
        })", "/etc/fsgate.json");
        REQUIRE(r.ok);
        CHECK(r.config.root == "/work");
        CHECK(r.config.log_level == "debug");
        CHECK(r.config.source_path == "/etc/fsgate.json");
    }

    SUBCASE("all keys are optional") {
        auto r = parse_workspace_config("{}");
        REQUIRE(r.ok);
        CHECK(r.config.root.empty());
        CHECK(r.config.log_level.empty());
    }

    SUBCASE("unknown keys are ignored") {
        auto r = parse_workspace_config(R"({"root": "/work", "theme": "dark"})");
        REQUIRE(r.ok);
        CHECK(r.config.root == "/work");
    }

    SUBCASE("wrong schema") {
        auto r = parse_workspace_config(R"({"$schema": "fsgate.config.v9"})");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("$schema") != std::string::npos);
    }

    SUBCASE("not an object") {
        auto r = parse_workspace_config("[1, 2]");
        CHECK_FALSE(r.ok);
        CHECK(r.error == "JSON must be an object");
    }

    SUBCASE("malformed JSON") {
        auto r = parse_workspace_config("{\"root\": ");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("JSON parse error") != std::string::npos);
    }

    SUBCASE("root must be a string") {
        auto r = parse_workspace_config(R"({"root": 42})");
        CHECK_FALSE(r.ok);
        CHECK(r.error == "root must be a string");
    }

    SUBCASE("unknown log level") {
        auto r = parse_workspace_config(R"({"log_level": "chatty"})");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("chatty") != std::string::npos);
    }
}

TEST_CASE("load_workspace_config") {
    TempRoot temp;

    SUBCASE("reads a file") {
        temp.write("fsgate.json", R"({"root": "data"})");
        auto r = load_workspace_config(temp.sub("fsgate.json"));
        REQUIRE(r.ok);
        CHECK(r.config.root == "data");
        CHECK(r.config.source_path == temp.sub("fsgate.json"));
    }

    SUBCASE("missing file") {
        auto r = load_workspace_config(temp.sub("missing.json"));
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("cannot open") != std::string::npos);
    }
}

TEST_CASE("parse_log_level") {
    CHECK(parse_log_level("trace") == spdlog::level::trace);
    CHECK(parse_log_level("debug") == spdlog::level::debug);
    CHECK(parse_log_level("INFO") == spdlog::level::info);
    CHECK(parse_log_level("warn") == spdlog::level::warn);
    CHECK(parse_log_level("error") == spdlog::level::err);
    CHECK(parse_log_level("critical") == spdlog::level::critical);
    CHECK(parse_log_level("off") == spdlog::level::off);
    CHECK_FALSE(parse_log_level("").has_value());
    CHECK_FALSE(parse_log_level("loud").has_value());
}

#ifndef _WIN32
TEST_CASE("resolve_workspace_root priority") {
    ScopedEnv env("FSGATE_ROOT", nullptr);

    WorkspaceConfig config;
    config.root = "/from/config";

    SUBCASE("explicit override wins") {
        ScopedEnv set("FSGATE_ROOT", "/from/env");
        auto r = resolve_workspace_root(std::string("/from/flag"), config);
        REQUIRE(r.isOk());
        CHECK(r.value() == "/from/flag");
    }

    SUBCASE("environment beats config") {
        ScopedEnv set("FSGATE_ROOT", "/from/env");
        auto r = resolve_workspace_root(std::nullopt, config);
        REQUIRE(r.isOk());
        CHECK(r.value() == "/from/env");
    }

    SUBCASE("config beats working directory") {
        auto r = resolve_workspace_root(std::nullopt, config);
        REQUIRE(r.isOk());
        CHECK(r.value() == "/from/config");
    }

    SUBCASE("relative config root is relative to the config file") {
        WorkspaceConfig relative;
        relative.root = "data";
        relative.source_path = "/etc/fsgate/fsgate.json";
        auto r = resolve_workspace_root(std::nullopt, relative);
        REQUIRE(r.isOk());
        CHECK(r.value() == "/etc/fsgate/data");
    }

    SUBCASE("falls back to the working directory") {
        auto r = resolve_workspace_root(std::string(), WorkspaceConfig{});
        REQUIRE(r.isOk());
        CHECK(r.value() == std::filesystem::current_path().string());
    }
}

TEST_CASE("resolve_log_level priority") {
    ScopedEnv env("FSGATE_LOG_LEVEL", nullptr);

    WorkspaceConfig config;
    config.log_level = "warn";

    CHECK(resolve_log_level(spdlog::level::debug, config) == spdlog::level::debug);
    CHECK(resolve_log_level(std::nullopt, config) == spdlog::level::warn);
    CHECK(resolve_log_level(std::nullopt, WorkspaceConfig{}) == spdlog::level::info);

    SUBCASE("environment beats config") {
        ScopedEnv set("FSGATE_LOG_LEVEL", "error");
        CHECK(resolve_log_level(std::nullopt, config) == spdlog::level::err);
    }

    SUBCASE("invalid environment value falls through") {
        ScopedEnv set("FSGATE_LOG_LEVEL", "loud");
        CHECK(resolve_log_level(std::nullopt, config) == spdlog::level::warn);
    }
}
#endif
