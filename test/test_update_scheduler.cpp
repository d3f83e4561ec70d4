/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include <gtest/gtest.h>
#include "fakes.h"
#include "line_formatter.h"
#include "update_scheduler.h"

namespace {

class SchedulerTest : public ::testing::Test {
protected:
    SchedulerTest()
        : surface(lcd, 3), nav(tree), scheduler(surface, clock, 30000) {}

    void SetUp() override {
        root = tree.addItem("Root", "top", nullptr, 2.0f);
        first = tree.addItem("First", "one", nullptr, 1.0f);
        second = tree.addItem("Second", "two", nullptr, 0.0f);
        tree.link(root, {first, second});
        tree.link(MENU_NONE, {root});
        nav.setObserver(&scheduler);
    }

    // Steps the clock in small slices, polling like the main loop
    void run(uint32_t ms) {
        for (uint32_t t = 0; t < ms; t += 10) {
            clock.advance(10);
            scheduler.update(nav);
        }
    }

    FakeDisplay lcd;
    ManualClock clock;
    DisplaySurface surface;
    MenuTree tree;
    Navigator nav;
    UpdateScheduler scheduler;
    MenuId root, first, second;
};

} // namespace

TEST_F(SchedulerTest, ShowingAnItemDrawsImmediately) {
    nav.push(root);

    EXPECT_EQ(scheduler.getDrawCount(), 1u);
    EXPECT_TRUE(lcd.backlight);
    EXPECT_EQ(lcd.screen[0], formatLine("Root", "", std::string(1, (char)GLYPH_ACTION), 16));
    EXPECT_EQ(lcd.screen[1], std::string(13, ' ') + "top");
}

TEST_F(SchedulerTest, NestedTitleCarriesGlyphs) {
    nav.push(root);
    nav.doAction();

    std::string expected = std::string(1, (char)GLYPH_UP) + "First";
    expected.resize(15, ' ');
    expected += (char)GLYPH_SIBLINGS;
    EXPECT_EQ(lcd.screen[0], expected);
}

TEST_F(SchedulerTest, RedrawsAtItemRate) {
    nav.push(root); // 2 Hz
    EXPECT_EQ(scheduler.getRedrawInterval(), 500u);

    run(2000);
    EXPECT_EQ(scheduler.getDrawCount(), 1u + 4u);
    EXPECT_EQ(scheduler.getTick(), 4u);
    EXPECT_TRUE(scheduler.isRedrawPending());
}

TEST_F(SchedulerTest, ZeroRateNeverRedraws) {
    nav.push(second);
    EXPECT_FALSE(scheduler.isRedrawPending());

    run(5000);
    EXPECT_EQ(scheduler.getDrawCount(), 1u);
}

TEST_F(SchedulerTest, IdleTimeoutTurnsBacklightOffAndStopsRedraw) {
    nav.push(root);
    ASSERT_TRUE(scheduler.isRedrawPending());

    run(30000);

    EXPECT_FALSE(lcd.backlight);
    EXPECT_FALSE(scheduler.isRedrawPending());
    EXPECT_FALSE(scheduler.isBacklightTimerArmed());

    // Nothing is drawn on a dark display
    uint32_t draws = scheduler.getDrawCount();
    run(5000);
    EXPECT_EQ(scheduler.getDrawCount(), draws);
}

TEST_F(SchedulerTest, TouchRestartsIdleTimer) {
    nav.push(root);
    nav.doAction();

    run(20000);
    nav.doNext();
    run(20000);
    EXPECT_TRUE(lcd.backlight);

    run(10000);
    EXPECT_FALSE(lcd.backlight);
}

TEST_F(SchedulerTest, PopAtRootWakesDarkDisplay) {
    nav.push(root);
    run(30000);
    ASSERT_FALSE(lcd.backlight);
    uint32_t draws = scheduler.getDrawCount();

    nav.doUp();

    EXPECT_TRUE(lcd.backlight);
    EXPECT_EQ(scheduler.getDrawCount(), draws + 1);
    EXPECT_TRUE(scheduler.isRedrawPending());
    EXPECT_EQ(nav.depth(), 1u);
}

TEST_F(SchedulerTest, PopAtRootWhileLitOnlyRestartsTimer) {
    nav.push(root);
    run(20000);
    uint32_t draws = scheduler.getDrawCount();

    nav.doUp();
    EXPECT_EQ(scheduler.getDrawCount(), draws);

    run(20000);
    EXPECT_TRUE(lcd.backlight);
}

TEST_F(SchedulerTest, NewItemResetsScrollTick) {
    nav.push(root);
    run(1500);
    ASSERT_GT(scheduler.getTick(), 0u);

    nav.doAction();
    EXPECT_EQ(scheduler.getTick(), 0u);
}

TEST_F(SchedulerTest, ZeroDelayKeepsBacklightOn) {
    scheduler.setBacklightDelay(0);
    nav.push(root);

    EXPECT_FALSE(scheduler.isBacklightTimerArmed());
    run(120000);
    EXPECT_TRUE(lcd.backlight);
}

TEST_F(SchedulerTest, DynamicTextIsReadAtDrawTime) {
    int counter = 0;
    MenuId live = tree.addItem("Live",
        TextProvider([&counter](const Navigator&) { return std::to_string(++counter); }),
        nullptr, 1.0f);

    nav.push(live);
    EXPECT_EQ(lcd.screen[1].back(), '1');

    run(1000);
    EXPECT_EQ(lcd.screen[1].back(), '2');
}

TEST_F(SchedulerTest, LongTitleScrollsEachTick) {
    MenuId marquee = tree.addItem("This title is much too long", "", nullptr, 10.0f);
    nav.push(marquee);
    EXPECT_EQ(lcd.screen[0].substr(0, 4), "This");

    run(100);
    EXPECT_EQ(lcd.screen[0].substr(0, 4), "his ");
}

TEST_F(SchedulerTest, ShutdownBlanksEverything) {
    nav.push(root);
    scheduler.shutdown();

    EXPECT_FALSE(lcd.backlight);
    EXPECT_FALSE(scheduler.isRedrawPending());
    EXPECT_FALSE(scheduler.isBacklightTimerArmed());
    EXPECT_EQ(lcd.clears, 1);
    EXPECT_EQ(lcd.screen[0], std::string(16, ' '));
}

TEST(DeadlineTimer, FiresOnceAndCancelIsIdempotent) {
    DeadlineTimer timer;
    timer.cancel();
    EXPECT_FALSE(timer.fired(0));

    timer.arm(100, 50);
    EXPECT_FALSE(timer.fired(149));
    EXPECT_EQ(timer.remaining(120), 30u);
    EXPECT_TRUE(timer.fired(150));
    EXPECT_FALSE(timer.fired(200));

    // Cancelling after expiry is harmless
    timer.cancel();
    timer.cancel();
    EXPECT_FALSE(timer.isArmed());
}

TEST(DeadlineTimer, SurvivesCounterWrap) {
    DeadlineTimer timer;
    timer.arm(0xFFFFFF00u, 0x200);

    EXPECT_FALSE(timer.fired(0xFFFFFFF0u));
    EXPECT_FALSE(timer.fired(0x000000F0u));
    EXPECT_TRUE(timer.fired(0x00000100u));
}

TEST_F(SchedulerTest, VerySlowRateDoesNotRedrawEveryPoll) {
    MenuId slow = tree.addItem("Slow", "item", nullptr, 0.0000003f);
    nav.push(slow);

    EXPECT_EQ(scheduler.getRedrawInterval(), DeadlineTimer::MAX_DELAY_MS);
    run(1000);
    EXPECT_EQ(scheduler.getDrawCount(), 1u);
    EXPECT_TRUE(scheduler.isRedrawPending());
}

TEST(UpdateScheduler, ClampRefreshRate) {
    EXPECT_EQ(UpdateScheduler::clampRefreshRate(0.0f), 0.0f);
    EXPECT_EQ(UpdateScheduler::clampRefreshRate(-2.0f), 0.0f);
    EXPECT_EQ(UpdateScheduler::clampRefreshRate(0.0000003f), MIN_REFRESH_RATE);
    EXPECT_EQ(UpdateScheduler::clampRefreshRate(1.5f), 1.5f);
    EXPECT_EQ(UpdateScheduler::clampRefreshRate(500.0f), MAX_REFRESH_RATE);
}

TEST(DeadlineTimer, DelayIsCappedBelowWrapWindow) {
    DeadlineTimer timer;
    timer.arm(0, 0xF0000000u);

    EXPECT_EQ(timer.getInterval(), DeadlineTimer::MAX_DELAY_MS);
    EXPECT_FALSE(timer.fired(10));
    EXPECT_FALSE(timer.fired(DeadlineTimer::MAX_DELAY_MS - 1));
    EXPECT_TRUE(timer.fired(DeadlineTimer::MAX_DELAY_MS));
}
