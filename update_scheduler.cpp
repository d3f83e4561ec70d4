/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "update_scheduler.h"
#include "line_formatter.h"

UpdateScheduler::UpdateScheduler(DisplaySurface& surface, Clock& clock, uint32_t backlightDelayMs)
    : _surface(surface), _clock(clock), _backlightDelay(backlightDelayMs),
      _tick(0), _drawCount(0) {}

void UpdateScheduler::touch() {
    uint32_t now = _clock.getMillis();

    _backlightTimer.cancel();
    _surface.setBacklight(true);

    // A delay of 0 keeps the backlight on permanently
    if (_backlightDelay > 0) _backlightTimer.arm(now, _backlightDelay);
}

void UpdateScheduler::onDisplay(const Navigator& nav) {
    touch();
    _tick = 0;
    draw(nav);
    scheduleRedraw(nav, _clock.getMillis());
}

void UpdateScheduler::onTouch(const Navigator& nav) {
    bool wasDark = !_surface.isBacklightOn();
    touch();

    // Waking a dark display shows fresh content instead of the stale frame
    if (wasDark) {
        draw(nav);
        scheduleRedraw(nav, _clock.getMillis());
    }
}

void UpdateScheduler::update(const Navigator& nav) {
    uint32_t now = _clock.getMillis();

    if (_backlightTimer.fired(now)) {
        _surface.setBacklight(false);
        _redrawTimer.cancel();
    }

    if (_redrawTimer.fired(now) && _surface.isBacklightOn()) {
        _tick++;
        draw(nav);
        _redrawTimer.arm(now, _redrawTimer.getInterval());
    }
}

void UpdateScheduler::shutdown() {
    _backlightTimer.cancel();
    _redrawTimer.cancel();
    _surface.setBacklight(false);
    _surface.clear();
}

void UpdateScheduler::draw(const Navigator& nav) {
    _drawCount++;

    const MenuItem* item = nav.current();
    if (!item) {
        _surface.clear();
        return;
    }

    const int width = _surface.cols();

    // Title: up glyph when nested, sibling and action glyphs on the right
    std::string pre;
    if (!nav.isRootMenu()) pre += (char)GLYPH_UP;

    std::string post;
    if (item->hasSiblings()) post += (char)GLYPH_SIBLINGS;
    if (item->hasAction()) post += (char)GLYPH_ACTION;

    _surface.setLine(0, formatLine(item->getTitle().getText(nav), pre, post,
                                   width, JUSTIFY_LEFT, _tick));

    // Description is right aligned on the second row
    _surface.setLine(1, formatLine(item->getDescription().getText(nav), "", "",
                                   width, JUSTIFY_RIGHT, _tick));

    _surface.flush();
}

float UpdateScheduler::clampRefreshRate(float rate) {
    if (!(rate > 0.0f)) return 0.0f;
    if (rate < MIN_REFRESH_RATE) return MIN_REFRESH_RATE;
    if (rate > MAX_REFRESH_RATE) return MAX_REFRESH_RATE;
    return rate;
}

void UpdateScheduler::scheduleRedraw(const Navigator& nav, uint32_t now) {
    _redrawTimer.cancel();

    const MenuItem* item = nav.current();
    if (!item || item->getRefreshRate() <= 0.0f) return;
    if (!_surface.isBacklightOn()) return;

    double period = 1000.0 / item->getRefreshRate();
    uint32_t interval = DeadlineTimer::MAX_DELAY_MS;
    if (period < (double)DeadlineTimer::MAX_DELAY_MS) interval = (uint32_t)period;
    if (interval == 0) interval = 1;
    _redrawTimer.arm(now, interval);
}
