/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef DEADLINE_TIMER_H
#define DEADLINE_TIMER_H

#include <stdint.h>

/**
 * @brief Monotonic millisecond source.
 * Implemented by the HAL on the board and by a manual clock in tests.
 */
class Clock {
public:
    virtual ~Clock() {}
    virtual uint32_t getMillis() = 0;
};

/**
 * @brief One-shot timer polled from the main loop.
 *
 * fired() reports expiry exactly once and disarms the timer. Cancelling an
 * idle or already fired timer does nothing. Deadlines survive the 49 day
 * millis() wrap, so delays are capped at MAX_DELAY_MS.
 */
class DeadlineTimer {
public:
    static constexpr uint32_t MAX_DELAY_MS = 0x7FFFFFFFUL;

    DeadlineTimer() : _armed(false), _deadline(0), _interval(0) {}

    void arm(uint32_t now, uint32_t delayMs);
    void cancel() { _armed = false; }

    // True once when the deadline has passed
    bool fired(uint32_t now);

    bool isArmed() const { return _armed; }
    uint32_t getInterval() const { return _interval; }

    // Milliseconds left, 0 when due or idle
    uint32_t remaining(uint32_t now) const;

private:
    bool _armed;
    uint32_t _deadline;
    uint32_t _interval;
};

#endif // DEADLINE_TIMER_H
