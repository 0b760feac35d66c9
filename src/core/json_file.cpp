#include "json_file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include "fd.hpp"
#include "logger.hpp"

namespace tcplat {
namespace {
std::string errno_text() {
    return std::strerror(errno);
}
}  // namespace

bool ensure_file(const std::string& path) {
    Fd fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644));
    if (!fd) {
        log(LogLevel::ERROR, "cannot open " + path + ": " + errno_text());
        return false;
    }
    return true;
}

bool file_length(const std::string& path, uint64_t& len) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        log(LogLevel::ERROR, "cannot stat " + path + ": " + errno_text());
        return false;
    }
    len = static_cast<uint64_t>(st.st_size);
    return true;
}

bool read_json(const std::string& path, nlohmann::json& out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        log(LogLevel::ERROR, "cannot read " + path);
        return false;
    }
    try {
        in >> out;
    } catch (const nlohmann::json::exception& e) {
        log(LogLevel::ERROR, "malformed JSON in " + path + ": " + e.what());
        return false;
    }
    return true;
}

bool overwrite_json(const std::string& path, const nlohmann::json& doc) {
    std::string data;
    try {
        data = doc.dump(2);
    } catch (const nlohmann::json::exception& e) {
        log(LogLevel::ERROR, "cannot serialize JSON for " + path + ": " + e.what());
        return false;
    }
    data += '\n';

    std::string tmp = path + ".tmp";
    {
        Fd fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
        if (!fd) {
            log(LogLevel::ERROR, "cannot open " + tmp + ": " + errno_text());
            return false;
        }
        if (!fd.write_all(reinterpret_cast<const uint8_t*>(data.data()), data.size())) {
            log(LogLevel::ERROR, "write to " + tmp + " failed: " + errno_text());
            ::unlink(tmp.c_str());
            return false;
        }
        if (::fsync(fd.get()) != 0) {
            log(LogLevel::ERROR, "fsync " + tmp + " failed: " + errno_text());
            ::unlink(tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        log(LogLevel::ERROR, "rename " + tmp + " -> " + path + " failed: " + errno_text());
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}
}  // namespace tcplat
