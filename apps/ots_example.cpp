// SPDX-License-Identifier: Apache-2.0
// Part of OneTimeStore (OTS) project.
// apps/ots_example.cpp

#include "ots/timed_store.hpp"
#include "ots/store_config.hpp"
#include "ots/id.hpp"
#include "ots/log.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <cstdio>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--collect <n>] [--ttl_ms <n>] [--count <n>]\n"
         "  [--log_file <path>]\n"
         "  [--debug 0|1]                    (log sweeps)\n"
         "  [--quiet 0|1]                    (suppress all console logs when 1)\n";
}

// Six-digit one-time code derived from a random id.
static std::string make_code(const std::string& hex) {
    unsigned long v = std::stoul(hex.substr(0, 8), nullptr, 16);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%06lu", v % 1000000UL);
    return buf;
}

int main(int argc, char** argv) {
    ots::StoreConfig cfg;
    cfg.collect_threshold = 16;
    cfg.expiration = std::chrono::milliseconds(200);
    int count = 32;
    bool quiet = false, debug = false;
    std::string log_file;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--collect" && i+1 < argc) cfg.collect_threshold = (std::size_t)std::stoul(argv[++i]);
            else if (a == "--ttl_ms" && i+1 < argc) cfg.expiration = std::chrono::milliseconds(std::stol(argv[++i]));
            else if (a == "--count" && i+1 < argc) count = std::stoi(argv[++i]);
            else if (a == "--log_file" && i+1 < argc) log_file = argv[++i];
            else if (a == "--debug" && i+1 < argc) debug = (std::stoi(argv[++i]) != 0);
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    if (!log_file.empty()) {
        ots::set_log_file(log_file);
    }
    if (debug) {
        ots::set_log_level(ots::LogLevel::Debug);
    }
    if (count < 0 || cfg.expiration.count() < 0) {
        usage(argv[0]);
        return 2;
    }

    try {
        ots::TimedStore store(cfg);

        std::vector<std::string> ids;
        for (int i = 0; i < count; ++i) {
            std::string id = ots::new_id();
            store.set(id, make_code(ots::new_id(4)));
            ids.push_back(id);
        }
        ots::log_at(ots::LogLevel::Info, "issued " + std::to_string(count) + " codes");

        int redeemed = 0;
        for (std::size_t i = 0; i < ids.size(); i += 2) {
            std::string code;
            if (store.lookup(ids[i], true, code)) ++redeemed;
        }
        ots::log_at(ots::LogLevel::Info, "redeemed " + std::to_string(redeemed) + " codes");

        std::this_thread::sleep_for(cfg.expiration + std::chrono::milliseconds(50));
        const std::size_t evicted = store.collect();

        const auto s = store.stats();
        ots::log_at(ots::LogLevel::Info,
                    "after ttl: evicted=" + std::to_string(evicted) +
                    " entries=" + std::to_string(s.entries) +
                    " queued=" + std::to_string(s.queued) +
                    " live=" + std::to_string(s.live) +
                    " sweeps=" + std::to_string(s.sweeps));
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
