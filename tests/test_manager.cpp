#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "../src/store/manager.hpp"

using namespace tcplat;

static std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static uint64_t size_of(const std::string& path) {
    return static_cast<uint64_t>(std::filesystem::file_size(path));
}

int main() {
    std::string dir = "/tmp/tcplat_manager_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    Kind kind{"probe", "example.com:80", 5000};

    std::unique_ptr<Manager> m;
    if (Manager::open(kind, dir, m) != ManagerError::Ok || !m) return 1;

    // bootstrap: index id 0, options {addrs:[0], interval:5000} on disk and in memory
    {
        auto index = m->index_read();
        if (index->size() != 1) return 2;
        if (index->get_addr(0).value_or("") != "example.com:80") return 3;
    }
    nlohmann::json on_disk = nlohmann::json::parse(slurp(dir + "/probe.options.json"));
    if (on_disk["interval"] != 5000 || on_disk["addrs"] != nlohmann::json::array({0})) return 4;
    {
        auto opt = m->options_read();
        if (opt->addrs.size() != 1 || opt->addrs[0] != 0 || opt->interval_ms != 5000) return 5;
    }
    if (!std::filesystem::exists(dir + "/probe.index.json")) return 6;
    if (!std::filesystem::exists(dir + "/probe.data.dat")) return 7;

    // unknown id: rejected, nothing changes
    std::string before = slurp(m->options_path());
    Options bad;
    bad.addrs = {0, 17};
    bad.interval_ms = 1000;
    if (m->options_update(bad) != ManagerError::InvalidAddrArgument) return 8;
    if (slurp(m->options_path()) != before) return 9;
    if (m->options_snapshot().interval_ms != 5000) return 10;

    Options zero;
    zero.addrs = {0};
    zero.interval_ms = 0;
    if (m->options_update(zero) != ManagerError::InvalidInterval) return 11;

    // valid update is in memory and on disk when the call returns
    uint32_t id = 0;
    if (m->add_addr("127.0.0.1:9", id) != ManagerError::Ok || id != 1) return 12;
    uint32_t again = 0;
    if (m->add_addr("127.0.0.1:9", again) != ManagerError::Ok || again != 1) return 13;
    Options good;
    good.addrs = {1, 0};
    good.interval_ms = 750;
    if (m->options_update(good) != ManagerError::Ok) return 14;
    if (m->options_snapshot() != good) return 15;
    Options from_disk;
    if (!options_from_json(nlohmann::json::parse(slurp(m->options_path())), from_disk)) return 16;
    if (from_disk != good) return 17;

    // append: on-disk record layout, time + index + value per record
    std::string data = m->data_path(Feed::Raw);
    uint64_t start = size_of(data);
    DiscreteRecord unreachable;
    unreachable.time = 1700000000u;
    unreachable.index = 1;
    unreachable.val = std::numeric_limits<float>::quiet_NaN();
    DiscreteRecord reachable;
    reachable.time = 1700000000u;
    reachable.index = 0;
    reachable.val = 12.5f;
    TimePackage round{unreachable, reachable};
    if (m->append_package(round) != ManagerError::Ok) return 18;
    if (size_of(data) != start + 2 * DiscreteRecord::kOnDiskSize) return 19;

    DataFile reader;
    if (!DataFile::open(data, reader)) return 20;
    std::vector<DiscreteRecord> stored;
    uint64_t reader_size = 0;
    if (!reader.size_bytes(reader_size) || reader_size != size_of(data)) return 30;
    if (!reader.read_all(stored) || stored.size() != 2) return 21;
    if (stored[0].index != 0 || stored[0].val != 12.5f) return 22;
    if (stored[1].index != 1 || !std::isnan(stored[1].val)) return 23;
    if (stored[0].time != 1700000000u || stored[1].time != 1700000000u) return 24;

    // a torn trailing record is skipped on read
    std::ofstream(data, std::ios::binary | std::ios::app) << "abcde";
    stored.clear();
    if (!reader.read_all(stored) || stored.size() != 2) return 31;

    // failed options write: error reported, memory and file keep the old value
    std::string committed = slurp(m->options_path());
    std::filesystem::create_directory(m->options_path() + ".tmp");
    Options next;
    next.addrs = {0};
    next.interval_ms = 1234;
    if (m->options_update(next) != ManagerError::OptionsFileIO) return 32;
    if (m->options_snapshot() != good) return 33;
    if (slurp(m->options_path()) != committed) return 34;
    std::filesystem::remove(m->options_path() + ".tmp");
    if (m->options_update(next) != ManagerError::Ok) return 35;
    if (m->options_update(good) != ManagerError::Ok) return 36;

    // a data file that refuses writes surfaces DataFileIO
    if (std::filesystem::exists("/dev/full")) {
        std::filesystem::create_symlink("/dev/full", dir + "/full.data.dat");
        std::unique_ptr<Manager> full;
        if (Manager::open(Kind{"full", "example.com:80", 5000}, dir, full) != ManagerError::Ok)
            return 37;
        if (full->append_package(round) != ManagerError::DataFileIO) return 38;
    }

    // existing options are loaded as-is on reopen
    m.reset();
    std::unique_ptr<Manager> reopened;
    if (Manager::open(kind, dir, reopened) != ManagerError::Ok) return 25;
    if (reopened->options_snapshot() != good) return 26;
    if (reopened->index_read()->size() != 2) return 27;

    std::ofstream(dir + "/corrupt.options.json") << "[1, 2";
    std::unique_ptr<Manager> corrupt;
    if (Manager::open(Kind{"corrupt", "example.com:80", 5000}, dir, corrupt) !=
        ManagerError::OptionsFileIO)
        return 28;
    if (corrupt) return 29;
    return 0;
}
