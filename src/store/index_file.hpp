#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace tcplat {
// Address id <-> "host:port" table persisted as JSON. Ids are assigned in increasing
// order and never reused.
class IndexFile {
   public:
    // Loads path, creating an empty index when the file is missing or empty.
    static bool open(const std::string& path, IndexFile& out);

    std::optional<std::string> get_addr(uint32_t id) const;
    std::optional<uint32_t> find_addr(const std::string& addr) const;
    // Assigns the next id to addr and persists the index before returning.
    bool add_addr(const std::string& addr, uint32_t& id);

    const std::map<uint32_t, std::string>& entries() const {
        return addrs_;
    }
    size_t size() const {
        return addrs_.size();
    }
    const std::string& path() const {
        return path_;
    }

   private:
    std::string path_;
    uint32_t next_id_{0};
    std::map<uint32_t, std::string> addrs_;

    bool save() const;
};
}  // namespace tcplat
