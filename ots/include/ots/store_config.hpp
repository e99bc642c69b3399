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
#include <functional>

namespace ots {

// Runs one background sweep. Must not block the caller waiting for it.
using SweepScheduler = std::function<void(std::function<void()>)>;

struct StoreConfig {
    // Insertions since the last sweep that trigger scheduling a new one.
    std::size_t collect_threshold = 100;

    // Age after which an entry is eligible for eviction.
    std::chrono::milliseconds expiration = std::chrono::minutes(10);

    // Scrub consumed/evicted/overwritten values before release.
    bool wipe_values = true;

    // Empty: one detached std::thread per sweep.
    SweepScheduler scheduler;
};

} // namespace ots
