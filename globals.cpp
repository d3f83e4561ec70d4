/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "globals.h"
#include "display_oled.h"
#include "display_terminal.h"
#include "hal.h"
#include "host_link.h"
#include "system_status.h"

// --- Host Link ---
// Status cache fed by '@' lines, actions sent as '!' lines
SystemStatus systemStatus(hal);
SerialHostLink hostLink(Serial);

// --- Display Devices ---
// The OLED is preferred; the terminal renderer stands in when it is missing
OledCharDisplay oledDisplay(display);
TerminalDisplay terminalDisplay(Serial);
