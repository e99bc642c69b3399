/*
 * Part of the OneTimeStore (OTS) project.
 *
 * SPDX-FileCopyrightText: 2025 OneTimeStore contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OneTimeStore (OTS). See LICENSE for details.
 */

#pragma once
#include <string>
#include <chrono>

namespace ots {
// Return current UTC timestamp in strict ISO8601 "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_iso8601_now();

// "1500ms", "90s", "10m" - compact form used in log lines.
std::string format_duration(std::chrono::milliseconds d);
} // namespace ots
