// SPDX-License-Identifier: Apache-2.0
// Part of OneTimeStore (OTS) project.
// tests/test_log.cpp

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "ots/log.hpp"

namespace ots {

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "ots_log_test.txt";
        std::remove(path_.c_str());
        set_log_file(path_);
    }

    void TearDown() override {
        set_log_file("");
        set_log_level(LogLevel::Info);
        std::remove(path_.c_str());
    }

    std::string contents() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
};

TEST_F(LogTest, LevelFiltersMessages) {
    set_log_level(LogLevel::Warn);
    EXPECT_FALSE(log_enabled(LogLevel::Info));
    EXPECT_TRUE(log_enabled(LogLevel::Error));

    log_at(LogLevel::Info, "hidden");
    log_at(LogLevel::Warn, "shown");

    const std::string text = contents();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN] "), std::string::npos);
    EXPECT_NE(text.find("shown"), std::string::npos);
}

TEST_F(LogTest, OffSilencesEverything) {
    set_log_level(LogLevel::Off);
    EXPECT_EQ(log_level(), LogLevel::Off);
    EXPECT_FALSE(log_enabled(LogLevel::Error));
    EXPECT_FALSE(log_enabled(LogLevel::Off));
    log_at(LogLevel::Error, "nothing");
    EXPECT_EQ(contents(), "");
}

TEST_F(LogTest, RawLineIsWrittenVerbatim) {
    log_line("plain line");
    EXPECT_EQ(contents(), "plain line\n");
}

} // namespace ots
