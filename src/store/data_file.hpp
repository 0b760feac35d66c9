#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "../core/fd.hpp"
#include "../core/record.hpp"

namespace tcplat {
// Append-only log of on-disk records for one (kind, feed) pair.
class DataFile {
   public:
    static bool open(const std::string& path, DataFile& out);

    bool append_element(const DiscreteRecord& rec);
    bool size_bytes(uint64_t& out) const;
    // Decodes every complete record; a truncated trailing record is skipped.
    bool read_all(std::vector<DiscreteRecord>& out) const;

    const std::string& path() const {
        return path_;
    }

   private:
    std::string path_;
    Fd fd_;
    std::vector<uint8_t> scratch_;
};
}  // namespace tcplat
