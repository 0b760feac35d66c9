#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "core/logger.hpp"
#include "core/round_channel.hpp"
#include "probes/tcp_connect.hpp"
#include "store/manager.hpp"
#include "workers/tcp_ping_worker.hpp"

using namespace tcplat;

namespace {
volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) {
    g_stop = 1;
}

bool prepare_dir(const std::string& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        log(LogLevel::ERROR, "cannot create data directory " + dir + ": " + ec.message());
        return false;
    }
    return true;
}

std::unique_ptr<Manager> open_manager(const std::string& dir) {
    if (!prepare_dir(dir)) return nullptr;
    std::unique_ptr<Manager> manager;
    ManagerError err = Manager::open(Kind::tcp_ping(), dir, manager);
    if (err != ManagerError::Ok) {
        log(LogLevel::ERROR, std::string("cannot open storage in ") + dir + ": " +
                                 error_name(err));
        return nullptr;
    }
    return manager;
}
}  // namespace

static int cmd_run(const std::string& dir, int duration_s) {
    auto manager = open_manager(dir);
    if (!manager) return 1;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    RoundChannel channel;
    TcpPingWorker worker(*manager);
    worker.start(channel);

    auto start = std::chrono::steady_clock::now();
    uint64_t rounds = 0;
    while (!g_stop) {
        TimePackage round;
        if (channel.recv_for(std::chrono::milliseconds(200), round)) {
            ManagerError err = manager->append_package(round);
            if (err != ManagerError::Ok) {
                log(LogLevel::ERROR, std::string("failed to store round: ") + error_name(err));
            } else {
                ++rounds;
            }
        }
        if (duration_s > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                               std::chrono::steady_clock::now() - start)
                               .count();
            if (elapsed >= duration_s) break;
        }
    }
    worker.stop();
    channel.close();
    TimePackage round;
    while (channel.recv_for(std::chrono::milliseconds(0), round)) {
        if (manager->append_package(round) == ManagerError::Ok) ++rounds;
    }
    log(LogLevel::INFO, "stored " + std::to_string(rounds) + " rounds in " +
                            manager->data_path(Feed::Raw));
    return 0;
}

static int cmd_show(const std::string& dir) {
    auto manager = open_manager(dir);
    if (!manager) return 1;
    Options opt = manager->options_snapshot();
    std::cout << "interval_ms: " << opt.interval_ms << "\n";
    std::cout << "probing:";
    for (uint32_t id : opt.addrs) std::cout << " " << id;
    std::cout << "\naddresses:\n";
    auto index = manager->index_read();
    for (const auto& kv : index->entries()) {
        std::cout << "  " << kv.first << "  " << kv.second << "\n";
    }
    return 0;
}

static int cmd_add_addr(const std::string& dir, const std::string& addr) {
    HostPort hp;
    if (!split_host_port(addr, hp)) {
        std::cerr << "expected <host:port>, got " << addr << "\n";
        return 1;
    }
    auto manager = open_manager(dir);
    if (!manager) return 1;
    uint32_t id = 0;
    ManagerError err = manager->add_addr(addr, id);
    if (err != ManagerError::Ok) {
        std::cerr << "add-addr failed: " << error_name(err) << "\n";
        return 1;
    }
    std::cout << id << "\n";
    return 0;
}

static int cmd_set(const std::string& dir, const std::string& interval,
                   const std::string& addrs) {
    uint32_t interval_ms = 0;
    if (!interval.empty() && !parse_interval_ms(interval, interval_ms)) {
        std::cerr << "invalid --interval (positive milliseconds): " << interval << "\n";
        return 1;
    }
    std::vector<uint32_t> ids;
    if (!addrs.empty() && !parse_addr_ids(addrs, ids)) {
        std::cerr << "invalid --addrs list: " << addrs << "\n";
        return 1;
    }
    auto manager = open_manager(dir);
    if (!manager) return 1;
    Options opt = manager->options_snapshot();
    if (!interval.empty()) opt.interval_ms = interval_ms;
    if (!addrs.empty()) opt.addrs = std::move(ids);
    ManagerError err = manager->options_update(opt);
    if (err != ManagerError::Ok) {
        std::cerr << "set failed: " << error_name(err) << "\n";
        return 1;
    }
    return 0;
}

static void print_usage() {
    std::cerr << "Usage: tcplat <run|show|add-addr|set> [options]\n"
              << "  run      --data <dir> [--duration <sec>] [--log-level <debug|info|warn|error>]\n"
              << "  show     --data <dir>\n"
              << "  add-addr --data <dir> <host:port>\n"
              << "  set      --data <dir> [--interval <ms>] [--addrs <id,id,...>]\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }
    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }

    std::string dir = "./tcplat-data";
    int duration_s = 0;
    std::string interval;
    std::string addrs;
    std::string positional;
    try {
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--data" && i + 1 < argc) {
                dir = argv[++i];
            } else if (a == "--duration" && i + 1 < argc) {
                duration_s = std::stoi(argv[++i]);
            } else if ((a == "--interval" || a == "--interval-ms") && i + 1 < argc) {
                interval = argv[++i];
            } else if (a == "--addrs" && i + 1 < argc) {
                addrs = argv[++i];
            } else if (a == "--log-level" && i + 1 < argc) {
                LogLevel lvl;
                if (!parse_log_level(argv[++i], lvl)) {
                    std::cerr << "unknown log level: " << argv[i] << "\n";
                    return 1;
                }
                set_log_level(lvl);
            } else if (positional.empty() && a.rfind("--", 0) != 0) {
                positional = a;
            } else {
                std::cerr << "unexpected argument: " << a << "\n";
                return 1;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "invalid numeric argument\n";
        return 1;
    }

    if (cmd == "run") return cmd_run(dir, duration_s);
    if (cmd == "show") return cmd_show(dir);
    if (cmd == "add-addr") {
        if (positional.empty()) {
            print_usage();
            return 1;
        }
        return cmd_add_addr(dir, positional);
    }
    if (cmd == "set") return cmd_set(dir, interval, addrs);
    std::cerr << "Unknown command\n";
    print_usage();
    return 1;
}
