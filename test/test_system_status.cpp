/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include <gtest/gtest.h>
#include "config.h"
#include "fakes.h"
#include "system_status.h"

TEST(SystemStatus, PlaceholdersBeforeHostSpeaks) {
    ManualClock clock;
    SystemStatus status(clock);

    EXPECT_FALSE(status.hasHost());
    EXPECT_EQ(status.getHostname(), "unknown");
    EXPECT_EQ(status.getIpAddress(), "127.0.0.1");
    EXPECT_EQ(status.getTime(), "--:--:--");
    EXPECT_EQ(status.getDate(), "----------");
    EXPECT_EQ(status.getUptime(), "?");
    EXPECT_EQ(status.getLoad(), "?");
    EXPECT_EQ(status.getRunlevel(), "Runlevel: ?");
    EXPECT_EQ(status.getServiceState("ssh"), "unknown");
    EXPECT_FALSE(status.isStale());
}

TEST(SystemStatus, ParsesHostLines) {
    ManualClock clock;
    SystemStatus status(clock);

    EXPECT_TRUE(status.parseLine("@hostname pi.example.org"));
    EXPECT_TRUE(status.parseLine("@ip 192.168.1.20"));
    EXPECT_TRUE(status.parseLine("@load 0.15 0.10 0.05"));
    EXPECT_TRUE(status.parseLine("@runlevel 5"));
    EXPECT_TRUE(status.parseLine("@service ssh active (running)"));

    EXPECT_EQ(status.getHostname(), "pi");
    EXPECT_EQ(status.getIpAddress(), "192.168.1.20");
    EXPECT_EQ(status.getLoad(), "0.15 0.10 0.05");
    EXPECT_EQ(status.getRunlevel(), "Runlevel: 5");
    EXPECT_EQ(status.getServiceState("ssh"), "active (running)");
    EXPECT_EQ(status.getUpdateCount(), 5u);
    EXPECT_TRUE(status.hasHost());
}

TEST(SystemStatus, RejectsMalformedLines) {
    ManualClock clock;
    SystemStatus status(clock);

    EXPECT_FALSE(status.parseLine(""));
    EXPECT_FALSE(status.parseLine("hostname pi"));
    EXPECT_FALSE(status.parseLine("@"));
    EXPECT_FALSE(status.parseLine("@hostname"));
    EXPECT_FALSE(status.parseLine("@colour blue"));
    EXPECT_FALSE(status.parseLine("@clock soon"));
    EXPECT_FALSE(status.parseLine("@uptime -5"));
    EXPECT_FALSE(status.parseLine("@service ssh"));
    EXPECT_EQ(status.getUpdateCount(), 0u);
}

TEST(SystemStatus, ClockKeepsTicking) {
    ManualClock clock;
    SystemStatus status(clock);

    // 2024-03-01 23:59:58 UTC
    ASSERT_TRUE(status.parseLine("@clock 1709337598"));
    EXPECT_EQ(status.getTime(), "23:59:58");
    EXPECT_EQ(status.getDate(), "2024-03-01");

    clock.advance(2500);
    EXPECT_EQ(status.getTime(), "00:00:00");
    EXPECT_EQ(status.getDate(), "2024-03-02");
}

TEST(SystemStatus, UptimeKeepsTicking) {
    ManualClock clock;
    SystemStatus status(clock);

    ASSERT_TRUE(status.parseLine("@uptime 3599"));
    EXPECT_EQ(status.getUptime(), "00:59:59");

    clock.advance(1000);
    EXPECT_EQ(status.getUptime(), "01:00:00");
}

TEST(SystemStatus, FormatsDurations) {
    EXPECT_EQ(SystemStatus::formatDuration(0), "00:00:00");
    EXPECT_EQ(SystemStatus::formatDuration(61), "00:01:01");
    EXPECT_EQ(SystemStatus::formatDuration(86399), "23:59:59");
    EXPECT_EQ(SystemStatus::formatDuration(86400 + 3 * 3600 + 7 * 60 + 9), "1d 03:07");
    EXPECT_EQ(SystemStatus::formatDuration(12 * 86400), "12d 00:00");
}

TEST(SystemStatus, StaleReportedOncePerEpisode) {
    ManualClock clock;
    SystemStatus status(clock);

    // Never heard from the host: not stale, nothing to report
    clock.advance(HOST_STALE_MS * 2);
    EXPECT_FALSE(status.checkStale());

    ASSERT_TRUE(status.parseLine("@hostname pi"));
    clock.advance(HOST_STALE_MS);
    EXPECT_FALSE(status.isStale());

    clock.advance(1);
    EXPECT_TRUE(status.isStale());
    EXPECT_TRUE(status.checkStale());
    EXPECT_FALSE(status.checkStale());

    // A fresh update starts a new episode
    ASSERT_TRUE(status.parseLine("@hostname pi"));
    EXPECT_FALSE(status.isStale());
    clock.advance(HOST_STALE_MS + 1);
    EXPECT_TRUE(status.checkStale());
}

TEST(SystemStatus, ClearForgetsEverything) {
    ManualClock clock;
    SystemStatus status(clock);

    status.parseLine("@hostname pi");
    status.parseLine("@service ssh active");
    status.clear();

    EXPECT_FALSE(status.hasHost());
    EXPECT_EQ(status.getHostname(), "unknown");
    EXPECT_EQ(status.getServiceState("ssh"), "unknown");
}
