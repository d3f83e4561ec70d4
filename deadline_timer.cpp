/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "deadline_timer.h"

void DeadlineTimer::arm(uint32_t now, uint32_t delayMs) {
    if (delayMs > MAX_DELAY_MS) delayMs = MAX_DELAY_MS;
    _deadline = now + delayMs;
    _interval = delayMs;
    _armed = true;
}

bool DeadlineTimer::fired(uint32_t now) {
    if (!_armed) return false;

    // Signed difference handles counter wrap
    if ((int32_t)(now - _deadline) < 0) return false;

    _armed = false;
    return true;
}

uint32_t DeadlineTimer::remaining(uint32_t now) const {
    if (!_armed) return 0;
    int32_t left = (int32_t)(_deadline - now);
    return left > 0 ? (uint32_t)left : 0;
}
