/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "input.h"
#include "hal.h"

InputManager::InputManager() {
    const int pins[4] = { PIN_BTN_UP, PIN_BTN_PREV, PIN_BTN_NEXT, PIN_BTN_ACTION };
    const InputEvent events[4] = { EVT_UP, EVT_PREV, EVT_NEXT, EVT_ACTION };

    for (int i = 0; i < 4; i++) {
        _buttons[i].pin = pins[i];
        _buttons[i].event = events[i];
        _buttons[i].stableState = false;
        _buttons[i].lastReading = false;
        _buttons[i].lastChange = 0;
    }

    _pendingEvent = EVT_NONE;
}

void InputManager::begin() {
    for (auto& btn : _buttons) {
        hal.setPinMode(btn.pin, INPUT_PULLUP);
    }
}

void InputManager::update() {
    uint32_t now = hal.getMillis();

    for (auto& btn : _buttons) {
        // Active low with pull-up
        bool reading = hal.digitalRead(btn.pin) == LOW;

        // Debounce Logic
        if (reading != btn.lastReading) {
            btn.lastChange = now;
            btn.lastReading = reading;
        }

        if (now - btn.lastChange > BUTTON_DEBOUNCE_MS && reading != btn.stableState) {
            btn.stableState = reading;

            // Fire on press, ignore release
            if (reading && _pendingEvent == EVT_NONE) {
                _pendingEvent = btn.event;
            }
        }
    }
}

InputEvent InputManager::getEvent() {
    InputEvent e = _pendingEvent;
    _pendingEvent = EVT_NONE; // Consume event
    return e;
}
