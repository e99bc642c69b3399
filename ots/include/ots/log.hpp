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

namespace ots {

enum class LogLevel { Debug, Info, Warn, Error, Off };

// Thread-safe logging (to stdout + optional file).
// Empty path (default) disables the file sink.
void set_log_file(const std::string& path);
void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// Raw line, no prefix, no level filter.
void log_line(const std::string& line);

// "[LEVEL] 2025-01-01T00:00:00Z msg", dropped below the current level.
void log_at(LogLevel level, const std::string& msg);

} // namespace ots
