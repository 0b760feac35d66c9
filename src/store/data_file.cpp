#include "data_file.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <utility>

#include "../core/logger.hpp"

namespace tcplat {
bool DataFile::open(const std::string& path, DataFile& out) {
    Fd fd = Fd::open_append(path);
    if (!fd) {
        log(LogLevel::ERROR, "cannot open data file " + path + ": " + std::strerror(errno));
        return false;
    }
    out.path_ = path;
    out.fd_ = std::move(fd);
    return true;
}

bool DataFile::append_element(const DiscreteRecord& rec) {
    scratch_.clear();
    encode_record(rec, scratch_);
    if (!fd_.write_all(scratch_.data(), scratch_.size())) {
        log(LogLevel::ERROR, "append to " + path_ + " failed: " + std::strerror(errno));
        return false;
    }
    return true;
}

bool DataFile::size_bytes(uint64_t& out) const {
    struct stat st {};
    if (::fstat(fd_.get(), &st) != 0) return false;
    out = static_cast<uint64_t>(st.st_size);
    return true;
}

bool DataFile::read_all(std::vector<DiscreteRecord>& out) const {
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        log(LogLevel::ERROR, "cannot read data file " + path_);
        return false;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    size_t off = 0;
    while (bytes.size() - off >= DiscreteRecord::kOnDiskSize) {
        DiscreteRecord rec;
        decode_record(bytes.data() + off, bytes.size() - off, rec);
        out.push_back(rec);
        off += DiscreteRecord::kOnDiskSize;
    }
    if (off != bytes.size()) {
        log(LogLevel::WARN, path_ + ": ignoring " + std::to_string(bytes.size() - off) +
                                " trailing bytes of a truncated record");
    }
    return true;
}
}  // namespace tcplat
