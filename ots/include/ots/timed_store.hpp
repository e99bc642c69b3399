/*
 * Part of the OneTimeStore (OTS) project.
 *
 * SPDX-FileCopyrightText: 2025 OneTimeStore contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OneTimeStore (OTS). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include "ots/store.hpp"
#include "ots/store_config.hpp"

namespace ots {

/**
 * In-memory store for short-lived tokens.
 *
 * Entries live in a hash index; an insertion-ordered queue of (time, id)
 * nodes drives eviction. Both are guarded by one reader/writer lock.
 * Once more than collect_threshold nodes are queued, set() hands a sweep to
 * the configured scheduler. The sweep pops expired nodes from the head of
 * the queue and stops at the first young one.
 *
 * Reads never return an entry older than the expiration, swept or not.
 * A consuming read leaves its queue node behind; the sweep drops it later.
 */
class TimedStore : public Store {
public:
    using clock = std::chrono::steady_clock;

    struct Stats {
        std::size_t   entries = 0;  // ids in the index
        std::size_t   queued  = 0;  // nodes in the eviction queue (orphans included)
        std::size_t   live    = 0;  // counter compared against collect_threshold
        std::uint64_t sweeps  = 0;
        std::uint64_t evicted = 0;  // queue nodes popped by all sweeps
    };

    // Throws std::invalid_argument on a negative expiration. Expirations
    // beyond half the clock's range are clamped; config() shows the result.
    explicit TimedStore(const StoreConfig& cfg);
    ~TimedStore() override;

    TimedStore(const TimedStore&) = delete;
    TimedStore& operator=(const TimedStore&) = delete;

    void set(const std::string& id, const std::string& value) override;
    std::string get(const std::string& id, bool clear) override;

    // Like get(), but reports presence. out is untouched on a miss.
    bool lookup(const std::string& id, bool clear, std::string& out);

    // Synchronous sweep. Returns the number of queue nodes evicted.
    std::size_t collect();
    std::size_t collect(clock::time_point now);

    // Drop everything and reset the live counter.
    void clear();

    std::size_t size() const;
    Stats stats() const;
    const StoreConfig& config() const { return _cfg; }

private:
    struct State;

    StoreConfig _cfg;
    std::shared_ptr<State> _st; // shared with in-flight background sweeps

    void schedule_sweep();
};

// Convenience for hosts that only need the Store contract.
std::shared_ptr<Store> make_timed_store(const StoreConfig& cfg);

} // namespace ots
