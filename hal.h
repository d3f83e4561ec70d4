/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef HAL_H
#define HAL_H

#include <Arduino.h>
#include "config.h"
#include "deadline_timer.h"

/**
 * @brief Hardware Abstraction Layer.
 *
 * Centralizes all direct hardware interactions to improve portability and testability.
 * Wraps Arduino and RP2040-specific APIs (GPIO, Watchdog, Timing) and serves
 * as the millisecond Clock for the menu scheduler.
 */
class HardwareAbstraction : public Clock {
public:
    HardwareAbstraction();

    void begin();

    // --- GPIO Control ---
    void setPinMode(int pin, int mode);
    void digitalWrite(int pin, int value);
    int digitalRead(int pin);

    // --- Watchdog Timer ---
    void watchdogEnable(int timeoutMs);
    void watchdogFeed();
    bool watchdogCausedReboot();

    // --- Timing ---
    uint32_t getMillis() override;
    void delayMs(uint32_t ms);

    // --- Semantic Hardware Control ---
    void setStatusLed(bool on);

private:
    bool _watchdogEnabled;
};

extern HardwareAbstraction hal;

#endif // HAL_H
