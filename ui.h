/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef UI_H
#define UI_H

#include <Arduino.h>
#include <string>
#include "config.h"
#include "globals.h"
#include "input.h"
#include "menu_session.h"

/**
 * @brief Manages the User Interface (Display and Input).
 *
 * Handles:
 * - Button polling and routing into the menu session
 * - Serial keystroke commands
 * - Session lifecycle: quit blanks the display, the next input starts a
 *   fresh session with a newly built menu tree
 * - Host link staleness reporting
 */
class UserInterface {
public:
    UserInterface();
    ~UserInterface();

    void begin(DisplayDevice& device);
    void update();

    // --- Session ---
    bool startSession();
    void endSession();
    bool isActive() const;

    // --- Serial Keystrokes ---
    DispatchResult handleCommand(const std::string& command);

    // Re-reads timing settings into the running session
    void applySettings();

    // --- Status ---
    std::string describe() const;
    bool isBacklightOn() const;

private:
    InputManager _input;
    MenuSession* _session;

    DispatchResult dispatch(InputEvent evt);
    void report(DispatchResult result);
};

#endif // UI_H
