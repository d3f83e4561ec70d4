/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef DISPLAY_TERMINAL_H
#define DISPLAY_TERMINAL_H

#include <Arduino.h>
#include "config.h"
#include "display_device.h"

/**
 * @brief Headless fallback: draws the character grid on an ANSI terminal
 * attached to a Print stream (normally the USB serial port).
 *
 * Menu glyphs are replaced by ASCII. The backlight is tracked only.
 */
class TerminalDisplay : public DisplayDevice {
public:
    explicit TerminalDisplay(Print& out);

    int rows() const override { return LCD_ROWS; }
    int cols() const override { return LCD_COLS; }

    void write(int row, int col, const std::string& text) override;
    void clear() override;

    bool getBacklight() const override { return _backlight; }
    void setBacklight(bool on) override { _backlight = on; }

private:
    Print& _out;
    bool _backlight;

    static char toAscii(char c);
};

#endif // DISPLAY_TERMINAL_H
