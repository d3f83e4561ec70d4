/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef SERIAL_CMD_H
#define SERIAL_CMD_H

#include <Arduino.h>
#include <vector>
#include <functional>
#include "config.h"
#include "globals.h"
#include "settings.h"

/**
 * @brief Handles Serial Command Interface.
 *
 * One line per command. Lines are routed to:
 * - SystemStatus ('@' host updates)
 * - The console (status, settings registry, error log, factory reset)
 * - The menu session (keystrokes: ^ < > * q, empty line to redraw)
 */

void handleSerialCommands();
void printStatus();
void printHelp();

#endif // SERIAL_CMD_H
