#include "fsgate/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace fsgate {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// write() until everything is out or a real error occurs
bool write_all(int fd, const uint8_t* data, size_t size) {
    size_t done = 0;
    while (done < size) {
        ssize_t n = write(fd, data + done, size - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}
#endif

std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;
    std::string temp_path = make_temp_filename(path);

#ifdef _WIN32
    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.error = "failed to create temp file for " + path;
        return result;
    }

    temp_file.write(reinterpret_cast<const char*>(content.data()),
                    static_cast<std::streamsize>(content.size()));
    temp_file.flush();
    bool written = temp_file.good();
    temp_file.close();
    if (!written) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to write " + path;
        return result;
    }

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file onto " + path;
        return result;
    }

    result.ok = true;
#else
    std::string dir_path = get_parent_directory(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file for " + path + ": " + std::strerror(errno);
        return result;
    }

    if (!write_all(fd, content.data(), content.size())) {
        int saved = errno;
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write " + path + ": " + std::strerror(saved);
        return result;
    }

    if (!fsync_fd(fd)) {
        int saved = errno;
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync " + path + ": " + std::strerror(saved);
        return result;
    }

    if (close(fd) != 0) {
        int saved = errno;
        unlink(temp_path.c_str());
        result.error = "failed to close " + path + ": " + std::strerror(saved);
        return result;
    }

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        int saved = errno;
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file onto " + path + ": " + std::strerror(saved);
        return result;
    }

    // The data is already in place; a failed directory fsync only weakens durability.
    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
#endif

    return result;
}

AtomicWriteResult atomic_create_directory(const std::string& path) {
    AtomicWriteResult result;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        result.error = "failed to create directory " + path + ": " + ec.message();
        return result;
    }

#ifndef _WIN32
    std::string parent = get_parent_directory(path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }
#endif

    result.ok = true;
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // Version 4
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // Variant 1

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace fsgate
