/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef DISPLAY_OLED_H
#define DISPLAY_OLED_H

#include <Arduino.h>
#include <Adafruit_SSD1306.h>
#include "config.h"
#include "display_device.h"

/**
 * @brief LCD_COLS x LCD_ROWS character grid drawn on an SSD1306 OLED.
 *
 * Each cell is LCD_CELL_WIDTH x LCD_CELL_HEIGHT pixels using the built-in
 * CP437 font stretched vertically. The "backlight" is the panel's
 * DISPLAYON/DISPLAYOFF state; GDDRAM keeps its content while off.
 */
class OledCharDisplay : public DisplayDevice {
public:
    explicit OledCharDisplay(Adafruit_SSD1306& oled);

    // Returns false when no panel answers on the I2C bus
    bool begin(uint8_t address, uint8_t contrast);

    int rows() const override { return LCD_ROWS; }
    int cols() const override { return LCD_COLS; }

    // Draws into the framebuffer only, present() sends it over I2C
    void write(int row, int col, const std::string& text) override;
    void present() override;
    void clear() override;

    bool getBacklight() const override { return _backlight; }
    void setBacklight(bool on) override;

    void setContrast(uint8_t contrast);

    // Echo every write to Serial (debug aid)
    void setMirror(bool mirror) { _mirror = mirror; }

private:
    Adafruit_SSD1306& _oled;
    bool _backlight;
    bool _mirror;
};

#endif // DISPLAY_OLED_H
