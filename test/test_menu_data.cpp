/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include <gtest/gtest.h>
#include "fakes.h"
#include "menu_data.h"
#include "navigator.h"

namespace {

class MenuDataTest : public ::testing::Test {
protected:
    MenuDataTest() : status(clock), nav(tree) {}

    MenuId build(const std::vector<std::string>& services) {
        MenuContext ctx;
        ctx.status = &status;
        ctx.host = &host;
        ctx.services = services;
        ctx.refreshRate = 1.0f;
        ctx.scrollRate = 3.0f;
        ctx.lastError = [this]() { return lastError; };
        return buildMenuTree(tree, ctx);
    }

    std::string title(MenuId id) { return tree.getItem(id)->getTitle().getText(nav); }
    std::string description(MenuId id) { return tree.getItem(id)->getDescription().getText(nav); }

    // Titles of the ring entered from the given parent
    std::vector<std::string> children(MenuId parent) {
        nav.clear();
        nav.push(parent);
        nav.doAction();

        std::vector<std::string> titles;
        MenuId start = nav.peek();
        MenuId id = start;
        do {
            titles.push_back(title(id) + "/" + description(id));
            id = tree.getItem(id)->getNext();
        } while (id != start);
        return titles;
    }

    ManualClock clock;
    SystemStatus status;
    FakeHost host;
    MenuTree tree;
    Navigator nav;
    std::string lastError;
};

} // namespace

TEST_F(MenuDataTest, RootRing) {
    MenuId root = build({"ssh"});
    ASSERT_NE(root, MENU_NONE);

    const MenuItem* info = tree.getItem(root);
    const MenuItem* system = tree.getItem(info->getNext());
    const MenuItem* services = tree.getItem(system->getNext());

    EXPECT_EQ(title(info->getId()), "Information");
    EXPECT_EQ(title(system->getId()), "System");
    EXPECT_EQ(title(services->getId()), "Services");
    EXPECT_EQ(services->getNext(), root);

    EXPECT_TRUE(info->hasAction());
    EXPECT_TRUE(system->hasAction());
    EXPECT_TRUE(services->hasAction());
}

TEST_F(MenuDataTest, InformationShowsHostFacts) {
    MenuId root = build({});
    EXPECT_EQ(description(root), "unknown");

    status.parseLine("@hostname pi");
    status.parseLine("@ip 10.0.0.7");
    status.parseLine("@load 1.00 0.50 0.25");
    EXPECT_EQ(description(root), "pi");

    std::vector<std::string> items = children(root);
    ASSERT_EQ(items.size(), 5u);
    EXPECT_EQ(items[0], "IP Address/10.0.0.7");
    EXPECT_EQ(items[1], "Time/--:--:--");
    EXPECT_EQ(items[2], "Date/----------");
    EXPECT_EQ(items[3], "Uptime/?");
    EXPECT_EQ(items[4], "Load/1.00 0.50 0.25");
}

TEST_F(MenuDataTest, SystemActionsReachHost) {
    MenuId root = build({});
    MenuId system = tree.getItem(root)->getNext();

    nav.push(root);
    nav.swap(system);
    nav.doAction();
    EXPECT_EQ(description(nav.peek()), "Shutdown");
    nav.doAction();

    nav.doNext();
    EXPECT_EQ(description(nav.peek()), "Reboot");
    nav.doAction();

    nav.doNext();
    EXPECT_EQ(title(nav.peek()), "Run level");
    nav.doAction();

    ASSERT_EQ(host.calls.size(), 3u);
    EXPECT_EQ(host.calls[0], "shutdown");
    EXPECT_EQ(host.calls[1], "reboot");
    EXPECT_EQ(host.calls[2], "status");
}

TEST_F(MenuDataTest, ErrorLogShowsLastError) {
    MenuId root = build({});
    std::vector<std::string> items = children(tree.getItem(root)->getNext());

    ASSERT_EQ(items.size(), 5u);
    EXPECT_EQ(items[3], "Error Log/No errors");
    EXPECT_EQ(items[4], "Firmware/" FIRMWARE_VERSION);

    lastError = "E4: No status from host";
    items = children(tree.getItem(root)->getNext());
    EXPECT_EQ(items[3], "Error Log/E4: No status from host");
}

TEST_F(MenuDataTest, ServicesListConfiguredNames) {
    MenuId root = build({"ssh", "nginx"});
    MenuId services = tree.getItem(tree.getItem(root)->getNext())->getNext();
    EXPECT_EQ(description(services), "2 configured");

    status.parseLine("@service nginx failed");

    std::vector<std::string> items = children(services);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "ssh/unknown");
    EXPECT_EQ(items[1], "nginx/failed");

    nav.doNext();
    nav.doAction();
    ASSERT_EQ(host.calls.size(), 1u);
    EXPECT_EQ(host.calls[0], "service nginx");
}

TEST_F(MenuDataTest, NoServicesPlaceholder) {
    MenuId root = build({});
    MenuId services = tree.getItem(tree.getItem(root)->getNext())->getNext();

    std::vector<std::string> items = children(services);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0], "Services/" NO_SERVICES_MESSAGE);
    EXPECT_FALSE(tree.getItem(nav.peek())->hasAction());
}

TEST_F(MenuDataTest, RebuildStartsFresh) {
    build({"ssh"});
    size_t first = tree.size();

    build({"ssh"});
    EXPECT_EQ(tree.size(), first);
}
