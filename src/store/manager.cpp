#include "manager.hpp"

#include <filesystem>
#include <utility>

#include "../core/json_file.hpp"
#include "../core/logger.hpp"

namespace tcplat {
Manager::Manager(PrivateTag, const Kind& kind, std::string dir)
    : kind_(kind), dir_(std::move(dir)) {}

std::string Manager::data_path(Feed feed) const {
    return (std::filesystem::path(dir_) / kind_.file_name(feed_file_suffix(feed))).string();
}

ManagerError Manager::open(const Kind& kind, const std::string& dir,
                           std::unique_ptr<Manager>& out) {
    auto m = std::make_unique<Manager>(PrivateTag{}, kind, dir);
    std::filesystem::path base(dir);

    std::string index_path = (base / kind.file_name("index.json")).string();
    if (!IndexFile::open(index_path, m->index_)) return ManagerError::IndexFileIO;

    // Only the raw feed is wired up; without it append_package reports FeedUnavailable.
    auto raw = std::make_unique<FeedFile>();
    if (DataFile::open(m->data_path(Feed::Raw), raw->file)) {
        m->data_files_.emplace(Feed::Raw, std::move(raw));
    } else {
        log(LogLevel::WARN, kind.name + ": raw feed unavailable");
    }

    m->options_path_ = (base / kind.file_name("options.json")).string();
    ManagerError err = m->load_or_bootstrap_options();
    if (err != ManagerError::Ok) return err;

    out = std::move(m);
    return ManagerError::Ok;
}

ManagerError Manager::load_or_bootstrap_options() {
    if (!ensure_file(options_path_)) return ManagerError::OptionsFileIO;
    uint64_t len = 0;
    if (!file_length(options_path_, len)) return ManagerError::OptionsFileIO;

    if (len > 0) {
        nlohmann::json doc;
        if (!read_json(options_path_, doc)) return ManagerError::OptionsFileIO;
        if (!options_from_json(doc, options_)) return ManagerError::OptionsFileIO;
        log(LogLevel::INFO, "Loaded " + kind_.name + " options: " + describe(options_));
        return ManagerError::Ok;
    }

    uint32_t id = 0;
    auto existing = index_.find_addr(kind_.default_addr);
    if (existing) {
        id = *existing;
    } else if (!index_.add_addr(kind_.default_addr, id)) {
        return ManagerError::IndexFileIO;
    }
    Options defaults;
    defaults.addrs.push_back(id);
    defaults.interval_ms = kind_.default_interval_ms;
    if (!overwrite_json(options_path_, options_to_json(defaults))) {
        return ManagerError::OptionsFileIO;
    }
    options_ = std::move(defaults);
    log(LogLevel::INFO, "Bootstrapped " + kind_.name + " options: " + describe(options_));
    return ManagerError::Ok;
}

ReadGuard<IndexFile> Manager::index_read() const {
    return ReadGuard<IndexFile>(index_mu_, index_);
}

ReadGuard<Options> Manager::options_read() const {
    return ReadGuard<Options>(options_mu_, options_);
}

Options Manager::options_snapshot() const {
    std::shared_lock<std::shared_mutex> lock(options_mu_);
    return options_;
}

ManagerError Manager::options_update(const Options& new_options) {
    if (new_options.interval_ms == 0) return ManagerError::InvalidInterval;
    {
        std::shared_lock<std::shared_mutex> index_lock(index_mu_);
        for (uint32_t id : new_options.addrs) {
            if (!index_.get_addr(id)) {
                log(LogLevel::WARN, kind_.name + ": rejected options update, unknown address id " +
                                        std::to_string(id));
                return ManagerError::InvalidAddrArgument;
            }
        }
    }

    std::unique_lock<std::shared_mutex> options_lock(options_mu_);
    std::lock_guard<std::mutex> write_lock(options_write_mu_);
    if (!overwrite_json(options_path_, options_to_json(new_options))) {
        return ManagerError::OptionsFileIO;
    }
    options_ = new_options;
    log(LogLevel::INFO, "Updated " + kind_.name + " options: " + describe(options_));
    return ManagerError::Ok;
}

ManagerError Manager::add_addr(const std::string& addr, uint32_t& id) {
    std::unique_lock<std::shared_mutex> lock(index_mu_);
    auto existing = index_.find_addr(addr);
    if (existing) {
        id = *existing;
        return ManagerError::Ok;
    }
    if (!index_.add_addr(addr, id)) return ManagerError::IndexFileIO;
    return ManagerError::Ok;
}

ManagerError Manager::append_package(const TimePackage& package) {
    // TODO: feed rounds into Feed::Averaged once windowed mean/sd aggregation exists
    auto it = data_files_.find(Feed::Raw);
    if (it == data_files_.end()) return ManagerError::FeedUnavailable;

    FeedFile& feed = *it->second;
    std::lock_guard<std::mutex> lock(feed.mu);
    for (const auto& rec : package) {
        if (!feed.file.append_element(rec)) return ManagerError::DataFileIO;
    }
    return ManagerError::Ok;
}
}  // namespace tcplat
