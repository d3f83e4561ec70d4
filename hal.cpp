/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "hal.h"

extern "C" {
#include <hardware/watchdog.h>
#include <pico/stdlib.h>
}

HardwareAbstraction hal;

HardwareAbstraction::HardwareAbstraction() {
    _watchdogEnabled = false;
}

void HardwareAbstraction::begin() {
    pinMode(PIN_STATUS_LED, OUTPUT);
    ::digitalWrite(PIN_STATUS_LED, LOW);
}

void HardwareAbstraction::setPinMode(int pin, int mode) {
    pinMode(pin, mode);
}

void HardwareAbstraction::digitalWrite(int pin, int value) {
    ::digitalWrite(pin, (PinStatus)value);
}

int HardwareAbstraction::digitalRead(int pin) {
    return ::digitalRead(pin);
}

void HardwareAbstraction::watchdogEnable(int timeoutMs) {
    // RP2040 Watchdog Max timeout is approx 8.3 seconds
    if (timeoutMs > 8300) timeoutMs = 8300;

    // Enable watchdog with pause on debug support
    watchdog_enable(timeoutMs, 1);
    _watchdogEnabled = true;
}

void HardwareAbstraction::watchdogFeed() {
    if (_watchdogEnabled) {
        watchdog_update();
    }
}

bool HardwareAbstraction::watchdogCausedReboot() {
    return watchdog_caused_reboot();
}

uint32_t HardwareAbstraction::getMillis() {
    return millis();
}

void HardwareAbstraction::delayMs(uint32_t ms) {
    delay(ms);
}

void HardwareAbstraction::setStatusLed(bool on) {
    ::digitalWrite(PIN_STATUS_LED, on ? HIGH : LOW);
}
