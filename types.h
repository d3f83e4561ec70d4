/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef TYPES_H
#define TYPES_H

#include <stdint.h>
#include "config.h"

// --- Enumerations ---

enum Justify {
    JUSTIFY_LEFT = -1,
    JUSTIFY_CENTER = 0,
    JUSTIFY_RIGHT = 1
};

// --- Data Structures ---

// Persistent runtime configuration (stored as a binary blob on LittleFS)
struct GlobalSettings {
    uint32_t schemaVersion;

    // Display
    uint16_t backlightDelay;   // Seconds, 0 = never turn off
    float defaultRefreshRate;  // Hz
    float scrollRefreshRate;   // Hz
    uint8_t diffMergeGap;      // Characters
    uint8_t displayContrast;   // 0-255
    bool requireDisplay;       // Halt instead of using the terminal fallback
    bool mirrorToSerial;       // Echo flushed spans to Serial

    // Services shown under the "Services" submenu
    char serviceNames[MAX_SERVICES][SERVICE_NAME_LENGTH + 1];
};

#endif // TYPES_H
