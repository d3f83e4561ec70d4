/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef UPDATE_SCHEDULER_H
#define UPDATE_SCHEDULER_H

#include <stdint.h>
#include "deadline_timer.h"
#include "display_surface.h"
#include "navigator.h"

/**
 * @brief Decides when the display is redrawn and when the backlight is lit.
 *
 * Handles:
 * - Immediate draw whenever the visible item changes
 * - Periodic redraw at the item's refresh rate while the backlight is on
 * - Backlight idle timeout (any touch restarts it)
 * - Marquee tick for lines wider than the display
 *
 * Timers are polled from update(), which must be called from the main loop.
 */
class UpdateScheduler : public NavigationObserver {
public:
    UpdateScheduler(DisplaySurface& surface, Clock& clock, uint32_t backlightDelayMs);

    // --- NavigationObserver ---
    void onDisplay(const Navigator& nav) override;
    void onTouch(const Navigator& nav) override;

    // Polls both timers
    void update(const Navigator& nav);

    // Wakes the backlight and restarts the idle timer
    void touch();

    // Cancels timers, turns the backlight off and blanks the display
    void shutdown();

    void setBacklightDelay(uint32_t delayMs) { _backlightDelay = delayMs; }

    // 0 (or anything not positive) disables redraw, others are held to
    // [MIN_REFRESH_RATE, MAX_REFRESH_RATE]
    static float clampRefreshRate(float rate);

    uint32_t getDrawCount() const { return _drawCount; }
    uint32_t getTick() const { return _tick; }
    bool isRedrawPending() const { return _redrawTimer.isArmed(); }
    bool isBacklightTimerArmed() const { return _backlightTimer.isArmed(); }
    uint32_t getRedrawInterval() const { return _redrawTimer.getInterval(); }

private:
    DisplaySurface& _surface;
    Clock& _clock;
    uint32_t _backlightDelay;

    DeadlineTimer _backlightTimer;
    DeadlineTimer _redrawTimer;

    uint32_t _tick;      // Marquee position, reset when a new item is shown
    uint32_t _drawCount;

    void draw(const Navigator& nav);
    void scheduleRedraw(const Navigator& nav, uint32_t now);
};

#endif // UPDATE_SCHEDULER_H
