/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef INPUT_H
#define INPUT_H

#include <Arduino.h>
#include "config.h"
#include "command_dispatcher.h"

/**
 * @brief Manages the four menu buttons (Up, Prev, Next, Action).
 *
 * Handles:
 * - Debouncing (BUTTON_DEBOUNCE_MS stable state)
 * - Press edge detection (one event per press)
 */
class InputManager {
public:
    InputManager();
    void begin();
    void update();

    // Check for pending events (consumes the event)
    InputEvent getEvent();

private:
    struct Button {
        int pin;
        InputEvent event;
        bool stableState;   // true = pressed
        bool lastReading;
        uint32_t lastChange;
    };

    Button _buttons[4];

    // Event Queue (Single item buffer)
    InputEvent _pendingEvent;
};

#endif // INPUT_H
