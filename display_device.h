/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef DISPLAY_DEVICE_H
#define DISPLAY_DEVICE_H

#include <string>

/**
 * @brief Fixed-size character display with a switchable backlight.
 *
 * Implemented by the SSD1306 character grid and by the serial terminal
 * fallback. Positions are zero based.
 */
class DisplayDevice {
public:
    virtual ~DisplayDevice() {}

    virtual int rows() const = 0;
    virtual int cols() const = 0;

    // Writes text starting at (row, col). Text never crosses the row end.
    // Buffered devices may hold writes back until present().
    virtual void write(int row, int col, const std::string& text) = 0;

    // Pushes buffered writes to the panel, once per flush
    virtual void present() {}
    virtual void clear() = 0;

    virtual bool getBacklight() const = 0;
    virtual void setBacklight(bool on) = 0;
};

#endif // DISPLAY_DEVICE_H
