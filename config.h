/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef CONFIG_H
#define CONFIG_H

// --- System Information ---
#define FIRMWARE_VERSION "v1.0.0"
#ifndef BUILD_DATE
#define BUILD_DATE __DATE__ " " __TIME__
#endif

// --- Display Hardware ---
#define OLED_I2C_ADDRESS 0x3C
#define OLED_WIDTH 128
#define OLED_HEIGHT 64

// Character grid emulated on the OLED
#define LCD_ROWS 2
#define LCD_COLS 16
#define LCD_CELL_WIDTH 8   // 6px glyph + 2px spacing
#define LCD_CELL_HEIGHT 16 // Glyphs drawn at text size (1, 2)
#define LCD_TOP_MARGIN 12  // Vertical offset of row 0 on the panel
#define LCD_ROW_SPACING 8  // Extra pixels between rows

// --- Menu Glyphs (CP437 codes on the OLED, ASCII on the terminal) ---
#define GLYPH_UP 0x18       // Up arrow: item has a parent
#define GLYPH_SIBLINGS 0x1D // Left/right arrow: item has siblings
#define GLYPH_ACTION 0x1A   // Right arrow: item has an action
#define SCROLL_SEPARATOR ' '

// --- Timing Defaults ---
#define DEFAULT_BACKLIGHT_DELAY 30   // Seconds of inactivity before the backlight turns off
#define DEFAULT_REFRESH_RATE 1.0f    // Redraws per second for live items
#define DEFAULT_SCROLL_RATE 3.0f     // Redraws per second for marquee items
#define MIN_REFRESH_RATE 0.01f       // Slowest periodic redraw, 0 disables it
#define MAX_REFRESH_RATE 20.0f
#define DEFAULT_DIFF_MERGE_GAP 3     // Max unchanged chars bridged by a single write
#define DEFAULT_CONTRAST 0xCF

#define BUTTON_DEBOUNCE_MS 30
#define HOST_STALE_MS 120000UL       // Host facts older than this are flagged stale
#define WATCHDOG_TIMEOUT_MS 4000

// --- Serial ---
#define SERIAL_BAUD 115200
#define SERIAL_MONITOR_ENABLE true

// --- Services ---
#define MAX_SERVICES 4
#define SERVICE_NAME_LENGTH 16

// --- Pin Assignments (RP2040) ---

// I2C Interface (Display)
#define PIN_I2C0_SDA 4
#define PIN_I2C0_SCL 5

// Menu Buttons (active low, internal pull-up)
#define PIN_BTN_UP 6
#define PIN_BTN_PREV 7
#define PIN_BTN_NEXT 8
#define PIN_BTN_ACTION 9

// Status LED (used to signal a missing display when one is required)
#define PIN_STATUS_LED 25

// --- UI Strings ---
#define WELCOME_MESSAGE "SysMenu"
#define NO_SERVICES_MESSAGE "No services"

// --- Storage Schema ---
#define SETTINGS_SCHEMA_VERSION 1

#endif // CONFIG_H
