#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "../core/record.hpp"
#include "data_file.hpp"
#include "feed.hpp"
#include "index_file.hpp"
#include "kind.hpp"
#include "manager_error.hpp"
#include "options.hpp"

namespace tcplat {
// Shared-read view of a Manager-owned value. Holds the lock for its lifetime, so it
// must not be kept across a call that takes the same lock for writing.
template <typename T>
class ReadGuard {
   public:
    ReadGuard(std::shared_mutex& mu, const T& value) : lock_(mu), value_(&value) {}

    const T& operator*() const {
        return *value_;
    }
    const T* operator->() const {
        return value_;
    }

   private:
    std::shared_lock<std::shared_mutex> lock_;
    const T* value_;
};

// Single owner of one kind's file-backed state: the address index, the options and
// the per-feed data files. Workers and external callers go through it so that no
// reader observes a partial update.
class Manager {
   public:
    // Opens (creating where missing) "<kind>.index.json", "<kind>.data.dat" and
    // "<kind>.options.json" under dir. An empty options file is bootstrapped from the
    // kind's default address and interval.
    static ManagerError open(const Kind& kind, const std::string& dir,
                             std::unique_ptr<Manager>& out);

    struct PrivateTag {
        explicit PrivateTag() = default;
    };
    // Use open(); the tag keeps construction private to this class.
    Manager(PrivateTag, const Kind& kind, std::string dir);

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    const Kind& kind() const {
        return kind_;
    }
    const std::string& options_path() const {
        return options_path_;
    }
    std::string data_path(Feed feed) const;

    ReadGuard<IndexFile> index_read() const;
    ReadGuard<Options> options_read() const;
    // Copy of the options taken under a single shared lock.
    Options options_snapshot() const;

    // Replaces the options after checking every address id against the index. The
    // new value is persisted first and only then swapped in, so a failed write
    // leaves both the file and the in-memory options untouched.
    ManagerError options_update(const Options& new_options);

    // Registers addr, or returns its existing id.
    ManagerError add_addr(const std::string& addr, uint32_t& id);

    // Appends every record of the round to the raw feed, stopping at the first failed
    // write. Records already written stay on disk.
    ManagerError append_package(const TimePackage& package);

   private:
    struct FeedFile {
        std::mutex mu;
        DataFile file;
    };

    Kind kind_;
    std::string dir_;

    mutable std::shared_mutex index_mu_;
    IndexFile index_;

    std::map<Feed, std::unique_ptr<FeedFile>> data_files_;

    // Serializes writers of the options file; guards no value.
    std::mutex options_write_mu_;
    std::string options_path_;

    mutable std::shared_mutex options_mu_;
    Options options_;

    ManagerError load_or_bootstrap_options();
};
}  // namespace tcplat
