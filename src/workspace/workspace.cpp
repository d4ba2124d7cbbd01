#include "fsgate/workspace.hpp"
#include "fsgate/path_guard.hpp"
#include "fsgate/platform.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fsgate {

namespace fs = std::filesystem;

Result<std::unique_ptr<Workspace>> Workspace::create(const std::string& root_path) {
    auto canonical = canonicalize_root(root_path);
    if (canonical.isErr()) {
        return Result<std::unique_ptr<Workspace>>::err(canonical.error());
    }

    spdlog::debug("workspace root: {}", canonical.value());
    return Result<std::unique_ptr<Workspace>>::ok(
        std::unique_ptr<Workspace>(new Workspace(canonical.value())));
}

Result<std::string> Workspace::guard(const char* operation, const std::string& path) const {
    auto result = validate_path(root_, path);
    if (result.isErr()) {
        spdlog::warn("{}: rejected '{}' ({}): {}", operation, path,
                     error_code_name(result.error().code()), result.error().message());
    } else {
        spdlog::debug("{}: {}", operation, result.value());
    }
    return result;
}

Result<std::string> Workspace::resolve(const std::string& path) const {
    return guard("resolve", path);
}

Result<std::string> Workspace::readText(const std::string& path) const {
    auto target = guard("read", path);
    if (target.isErr()) {
        return target;
    }
    const std::string& file_path = target.value();

    std::error_code ec;
    auto st = fs::status(file_path, ec);
    if (st.type() == fs::file_type::not_found) {
        return Result<std::string>::err(
            Error(ErrorCode::FILE_NOT_FOUND, "cannot read " + file_path + ": no such file"));
    }
    if (ec) {
        return Result<std::string>::err(error_from_errc(ec, "cannot read " + file_path));
    }
    if (fs::is_directory(st)) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "cannot read " + file_path + ": is a directory"));
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "cannot open " + file_path));
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "failed to read " + file_path));
    }

    std::string content = ss.str();
    if (!is_valid_utf8(content)) {
        return Result<std::string>::err(
            Error(ErrorCode::IO_ERROR, "stream did not contain valid UTF-8: " + file_path));
    }
    return Result<std::string>::ok(std::move(content));
}

Result<void> Workspace::writeText(const std::string& path, const std::string& content) const {
    return writeBytes("write", path, std::vector<uint8_t>(content.begin(), content.end()));
}

Result<void> Workspace::writeBinary(const std::string& path,
                                    const std::vector<uint8_t>& content) const {
    return writeBytes("write-binary", path, content);
}

Result<void> Workspace::writeBytes(const char* operation, const std::string& path,
                                   const std::vector<uint8_t>& content) const {
    auto target = guard(operation, path);
    if (target.isErr()) {
        return Result<void>::err(target.error());
    }
    const std::string& file_path = target.value();

    // Root itself or any directory: the temp file would land beside it
    std::error_code ec;
    auto st = fs::symlink_status(file_path, ec);
    if (fs::is_directory(st)) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, "cannot write " + file_path + ": is a directory"));
    }

    std::string parent = get_parent_directory(file_path);
    if (!parent.empty()) {
        auto created = atomic_create_directory(parent);
        if (!created.ok) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, created.error));
        }
    }

    auto written = atomic_write_file(file_path, content);
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, written.error));
    }
    return Result<void>::ok();
}

Result<std::vector<std::string>> Workspace::listFiles(const std::string& path) const {
    using ListResult = Result<std::vector<std::string>>;

    auto target = guard("list", path);
    if (target.isErr()) {
        return ListResult::err(target.error());
    }
    const std::string& dir_path = target.value();

    std::error_code ec;
    fs::directory_iterator it(dir_path, ec);
    if (ec) {
        return ListResult::err(error_from_errc(ec, "cannot list " + dir_path));
    }

    std::vector<std::string> files;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        std::string name = get_filename(it->path().string());
        if (!is_valid_utf8(name)) {
            spdlog::debug("list: skipping non-UTF-8 name in {}", dir_path);
            continue;
        }
        files.push_back(std::move(name));
    }
    if (ec) {
        return ListResult::err(error_from_errc(ec, "cannot list " + dir_path));
    }
    return ListResult::ok(std::move(files));
}

Result<void> Workspace::deleteFile(const std::string& path) const {
    auto target = guard("delete", path);
    if (target.isErr()) {
        return Result<void>::err(target.error());
    }
    const std::string& file_path = target.value();

    std::error_code ec;
    auto st = fs::symlink_status(file_path, ec);
    if (st.type() == fs::file_type::not_found) {
        return Result<void>::err(
            Error(ErrorCode::FILE_NOT_FOUND, "cannot delete " + file_path + ": no such file"));
    }
    if (ec) {
        return Result<void>::err(error_from_errc(ec, "cannot delete " + file_path));
    }
    if (fs::is_directory(st)) {
        return Result<void>::err(
            Error(ErrorCode::IO_ERROR, "cannot delete " + file_path + ": is a directory"));
    }

    if (!fs::remove(file_path, ec)) {
        if (ec) {
            return Result<void>::err(error_from_errc(ec, "cannot delete " + file_path));
        }
        return Result<void>::err(
            Error(ErrorCode::FILE_NOT_FOUND, "cannot delete " + file_path + ": no such file"));
    }
    return Result<void>::ok();
}

std::string join_paths(const std::vector<std::string>& segments) {
    fs::path p;
    for (const auto& segment : segments) {
        p /= segment;
    }
    return to_portable_path(p.string());
}

} // namespace fsgate
