/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef COMMAND_DISPATCHER_H
#define COMMAND_DISPATCHER_H

#include <string>
#include "navigator.h"

// Abstracted Input Events (buttons and keystrokes)
enum InputEvent {
    EVT_NONE,
    EVT_UP,      // Back to the parent item
    EVT_PREV,    // Previous sibling
    EVT_NEXT,    // Next sibling
    EVT_ACTION,  // Run the item's action / open its submenu
    EVT_QUIT,    // End the session
    EVT_REFRESH, // Redraw without navigating
    EVT_UNKNOWN  // Unrecognized keystroke
};

enum DispatchResult {
    DISPATCH_OK,
    DISPATCH_QUIT, // Caller should end the session
    DISPATCH_HELP  // Caller should print helpText()
};

/**
 * @brief Maps input events onto Navigator operations.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(Navigator& nav) : _nav(nav) {}

    DispatchResult handle(InputEvent evt);
    DispatchResult handleCommand(const std::string& command) { return handle(parseCommand(command)); }

    // Keyboard mapping: "^ u 6", "< p ,", "> n .", "* x <space>", "q quit", ""
    static InputEvent parseCommand(const std::string& command);
    static const char* helpText();
    static const char* eventName(InputEvent evt);

private:
    Navigator& _nav;
};

#endif // COMMAND_DISPATCHER_H
