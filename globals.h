/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef GLOBALS_H
#define GLOBALS_H

#include "types.h"
#include <Adafruit_SSD1306.h>

// Forward declarations to avoid circular dependencies
class Settings;
class UserInterface;
class SystemStatus;
class SerialHostLink;
class OledCharDisplay;
class TerminalDisplay;

// --- Global Object References ---
// Defined in SysMenu.ino or respective .cpp files
extern Settings settings;
extern UserInterface ui;
extern SystemStatus systemStatus;
extern SerialHostLink hostLink;

extern Adafruit_SSD1306 display;
extern OledCharDisplay oledDisplay;
extern TerminalDisplay terminalDisplay;

#endif // GLOBALS_H
