/*
 * Part of the OneTimeStore (OTS) project.
 *
 * SPDX-FileCopyrightText: 2025 OneTimeStore contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OneTimeStore (OTS). See LICENSE for details.
 */

#include "ots/timed_store.hpp"
#include "ots/log.hpp"
#include "ots/internal/time.hpp"
#include "ots/internal/utils.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

namespace ots {

struct TimedStore::State {
    struct Entry {
        std::string       value;
        clock::time_point stored; // time of the latest set()
    };
    struct QueueNode {
        clock::time_point inserted_at;
        std::string       id;
    };

    State(clock::duration exp, bool wipe)
        : expiration(exp), wipe_values(wipe) {}

    const clock::duration expiration;
    const bool wipe_values;

    mutable std::shared_mutex mtx;
    std::unordered_map<std::string, Entry> index;
    std::deque<QueueNode> queue;
    // Written under the exclusive lock; set() reads it after unlocking.
    std::atomic<std::size_t> live{0};
    std::uint64_t sweeps  = 0;
    std::uint64_t evicted = 0;

    bool expired(clock::time_point t, clock::time_point now) const {
        return now - t > expiration;
    }

    void erase_locked(std::unordered_map<std::string, Entry>::iterator it) {
        if (wipe_values) internal::secure_wipe(it->second.value);
        index.erase(it);
    }

    // One pass from the head of the queue; stops at the first young node.
    std::size_t sweep(clock::time_point now, std::size_t& queued_after) {
        std::unique_lock<std::shared_mutex> lk(mtx);
        std::size_t n = 0;
        while (!queue.empty()) {
            const QueueNode& node = queue.front();
            if (!expired(node.inserted_at, now)) break;

            // Orphans (already consumed) have no index entry. An entry re-set
            // after this node was queued belongs to a younger node.
            auto it = index.find(node.id);
            if (it != index.end() && it->second.stored <= node.inserted_at) {
                erase_locked(it);
            }
            queue.pop_front();
            live.fetch_sub(1, std::memory_order_relaxed);
            ++n;
        }
        ++sweeps;
        evicted += n;
        queued_after = queue.size();
        return n;
    }

    std::size_t run_sweep(clock::time_point now) {
        std::size_t queued = 0;
        const std::size_t n = sweep(now, queued);
        if (n > 0 && log_enabled(LogLevel::Debug)) {
            log_at(LogLevel::Debug, "sweep: evicted=" + std::to_string(n) +
                                    " queued=" + std::to_string(queued));
        }
        return n;
    }
};

TimedStore::TimedStore(const StoreConfig& cfg)
    : _cfg(cfg)
{
    if (_cfg.expiration.count() < 0) {
        throw std::invalid_argument("TimedStore: expiration must not be negative");
    }
    // Larger values overflow clock::duration; treat them as "never expires".
    const auto max_expiration =
        std::chrono::duration_cast<std::chrono::milliseconds>(clock::duration::max() / 2);
    if (_cfg.expiration > max_expiration) {
        _cfg.expiration = max_expiration;
    }
    _st = std::make_shared<State>(
        std::chrono::duration_cast<clock::duration>(_cfg.expiration), _cfg.wipe_values);

    log_at(LogLevel::Debug, "TimedStore: collect_threshold=" +
                            std::to_string(_cfg.collect_threshold) +
                            " expiration=" + format_duration(_cfg.expiration));
}

TimedStore::~TimedStore() = default;

void TimedStore::set(const std::string& id, const std::string& value) {
    {
        std::unique_lock<std::shared_mutex> lk(_st->mtx);
        // Timestamp under the lock keeps the queue ordered by time.
        const auto now = clock::now();
        auto& e = _st->index[id];
        if (_st->wipe_values) internal::secure_wipe(e.value);
        e.value  = value;
        e.stored = now;
        _st->queue.push_back(State::QueueNode{now, id});
        _st->live.fetch_add(1, std::memory_order_relaxed);
    }
    // Racy by contract: concurrent setters may each schedule a sweep.
    if (_st->live.load(std::memory_order_relaxed) > _cfg.collect_threshold) {
        schedule_sweep();
    }
}

std::string TimedStore::get(const std::string& id, bool clear) {
    std::string value;
    (void)lookup(id, clear, value);
    return value;
}

bool TimedStore::lookup(const std::string& id, bool clear, std::string& out) {
    const auto now = clock::now();

    if (!clear) {
        std::shared_lock<std::shared_mutex> lk(_st->mtx);
        auto it = _st->index.find(id);
        if (it == _st->index.end() || _st->expired(it->second.stored, now)) {
            return false;
        }
        out = it->second.value;
        return true;
    }

    std::unique_lock<std::shared_mutex> lk(_st->mtx);
    auto it = _st->index.find(id);
    if (it == _st->index.end()) {
        return false;
    }
    const bool fresh = !_st->expired(it->second.stored, now);
    if (fresh) {
        out = it->second.value;
    }
    // The queue node stays behind as an orphan.
    _st->erase_locked(it);
    return fresh;
}

std::size_t TimedStore::collect() {
    return _st->run_sweep(clock::now());
}

std::size_t TimedStore::collect(clock::time_point now) {
    return _st->run_sweep(now);
}

void TimedStore::clear() {
    std::unique_lock<std::shared_mutex> lk(_st->mtx);
    if (_st->wipe_values) {
        for (auto& kv : _st->index) internal::secure_wipe(kv.second.value);
    }
    _st->index.clear();
    _st->queue.clear();
    _st->live.store(0, std::memory_order_relaxed);
}

std::size_t TimedStore::size() const {
    std::shared_lock<std::shared_mutex> lk(_st->mtx);
    return _st->index.size();
}

TimedStore::Stats TimedStore::stats() const {
    std::shared_lock<std::shared_mutex> lk(_st->mtx);
    Stats s;
    s.entries = _st->index.size();
    s.queued  = _st->queue.size();
    s.live    = _st->live.load(std::memory_order_relaxed);
    s.sweeps  = _st->sweeps;
    s.evicted = _st->evicted;
    return s;
}

void TimedStore::schedule_sweep() {
    // A sweep that outlives its store does nothing.
    std::weak_ptr<State> weak = _st;
    auto task = [weak]() {
        if (auto st = weak.lock()) {
            st->run_sweep(clock::now());
        }
    };

    if (_cfg.scheduler) {
        _cfg.scheduler(std::move(task));
        return;
    }

    try {
        std::thread(std::move(task)).detach();
    } catch (const std::system_error& e) {
        // set() stays total; the next threshold crossing retries.
        log_at(LogLevel::Error, std::string("TimedStore: cannot start sweep thread: ") + e.what());
    }
}

std::shared_ptr<Store> make_timed_store(const StoreConfig& cfg) {
    return std::make_shared<TimedStore>(cfg);
}

} // namespace ots
