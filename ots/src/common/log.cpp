/*
 * Part of the OneTimeStore (OTS) project.
 *
 * SPDX-FileCopyrightText: 2025 OneTimeStore contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OneTimeStore (OTS). See LICENSE for details.
 */

#include "ots/log.hpp"
#include "ots/internal/time.hpp"
#include <atomic>
#include <mutex>
#include <fstream>
#include <iostream>

namespace {
std::mutex g_log_mtx;
std::ofstream g_log_ofs;
std::string g_log_path;
std::atomic<int> g_log_level{static_cast<int>(ots::LogLevel::Info)};

void open_if_needed_unlocked() {
    if (!g_log_path.empty() && !g_log_ofs.is_open()) {
        g_log_ofs.open(g_log_path, std::ios::out | std::ios::app);
    }
}

const char* level_tag(ots::LogLevel level) {
    switch (level) {
    case ots::LogLevel::Debug: return "[DEBUG] ";
    case ots::LogLevel::Info:  return "[INFO] ";
    case ots::LogLevel::Warn:  return "[WARN] ";
    case ots::LogLevel::Error: return "[ERROR] ";
    default:                   return "";
    }
}
} // namespace

namespace ots {

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_log_path = path;
    if (g_log_ofs.is_open()) {
        g_log_ofs.close();
    }
    open_if_needed_unlocked();
}

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel level) {
    return level != LogLevel::Off &&
           static_cast<int>(level) >= g_log_level.load(std::memory_order_relaxed);
}

void log_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    open_if_needed_unlocked();
    if (g_log_ofs.is_open() && g_log_ofs) {
        g_log_ofs << line << '\n';
        g_log_ofs.flush();
    }
    std::cout << line << '\n';
}

void log_at(LogLevel level, const std::string& msg) {
    if (!log_enabled(level)) return;
    log_line(std::string(level_tag(level)) + utc_iso8601_now() + " " + msg);
}

} // namespace ots
