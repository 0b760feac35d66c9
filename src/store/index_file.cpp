#include "index_file.hpp"

#include <nlohmann/json.hpp>

#include "../core/json_file.hpp"
#include "../core/logger.hpp"

namespace tcplat {
bool IndexFile::open(const std::string& path, IndexFile& out) {
    out.path_ = path;
    out.next_id_ = 0;
    out.addrs_.clear();
    if (!ensure_file(path)) return false;
    uint64_t len = 0;
    if (!file_length(path, len)) return false;
    if (len == 0) return true;

    nlohmann::json doc;
    if (!read_json(path, doc)) return false;
    try {
        for (const auto& entry : doc.at("addrs")) {
            uint32_t id = entry.at("id").get<uint32_t>();
            out.addrs_[id] = entry.at("addr").get<std::string>();
            if (id >= out.next_id_) out.next_id_ = id + 1;
        }
        // next_id may run ahead of the entries; ids are never handed out twice
        uint32_t stored_next = doc.value("next_id", out.next_id_);
        if (stored_next > out.next_id_) out.next_id_ = stored_next;
    } catch (const nlohmann::json::exception& e) {
        log(LogLevel::ERROR, "invalid index file " + path + ": " + e.what());
        return false;
    }
    return true;
}

std::optional<std::string> IndexFile::get_addr(uint32_t id) const {
    auto it = addrs_.find(id);
    if (it == addrs_.end()) return std::nullopt;
    return it->second;
}

std::optional<uint32_t> IndexFile::find_addr(const std::string& addr) const {
    for (const auto& kv : addrs_) {
        if (kv.second == addr) return kv.first;
    }
    return std::nullopt;
}

bool IndexFile::add_addr(const std::string& addr, uint32_t& id) {
    uint32_t assigned = next_id_;
    addrs_[assigned] = addr;
    ++next_id_;
    if (!save()) {
        addrs_.erase(assigned);
        --next_id_;
        return false;
    }
    id = assigned;
    log(LogLevel::INFO, "index " + path_ + ": " + std::to_string(id) + " -> " + addr);
    return true;
}

bool IndexFile::save() const {
    nlohmann::json doc;
    doc["next_id"] = next_id_;
    doc["addrs"] = nlohmann::json::array();
    for (const auto& kv : addrs_) {
        doc["addrs"].push_back({{"id", kv.first}, {"addr", kv.second}});
    }
    return overwrite_json(path_, doc);
}
}  // namespace tcplat
