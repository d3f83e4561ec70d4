/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "display_oled.h"

OledCharDisplay::OledCharDisplay(Adafruit_SSD1306& oled)
    : _oled(oled), _backlight(false), _mirror(false) {}

bool OledCharDisplay::begin(uint8_t address, uint8_t contrast) {
    if (!_oled.begin(SSD1306_SWITCHCAPVCC, address)) {
        return false;
    }

    _oled.cp437(true); // Correct glyph table for the arrow characters
    _oled.setTextWrap(false);
    _oled.setTextSize(1, 2);
    _oled.setTextColor(SSD1306_WHITE, SSD1306_BLACK);

    _oled.clearDisplay();
    _oled.display();
    setContrast(contrast);

    _oled.ssd1306_command(SSD1306_DISPLAYON);
    _backlight = true;
    return true;
}

void OledCharDisplay::write(int row, int col, const std::string& text) {
    if (row < 0 || row >= LCD_ROWS || col < 0 || col >= LCD_COLS) return;

    // Clip at the end of the row
    int len = (int)text.length();
    if (col + len > LCD_COLS) len = LCD_COLS - col;
    if (len <= 0) return;

    int x = col * LCD_CELL_WIDTH;
    int y = LCD_TOP_MARGIN + row * (LCD_CELL_HEIGHT + LCD_ROW_SPACING);

    // Erase the old glyphs of the span, then draw the new ones cell by cell
    _oled.fillRect(x, y, len * LCD_CELL_WIDTH, LCD_CELL_HEIGHT, SSD1306_BLACK);
    for (int i = 0; i < len; i++) {
        _oled.setCursor(x + i * LCD_CELL_WIDTH + 1, y);
        _oled.write((uint8_t)text[i]);
    }

    if (_mirror) {
        Serial.print("LCD ");
        Serial.print(row);
        Serial.print(",");
        Serial.print(col);
        Serial.print(": ");
        Serial.println(text.substr(0, len).c_str());
    }
}

void OledCharDisplay::present() {
    _oled.display();
}

void OledCharDisplay::clear() {
    _oled.clearDisplay();
    _oled.display();
}

void OledCharDisplay::setBacklight(bool on) {
    _oled.ssd1306_command(on ? SSD1306_DISPLAYON : SSD1306_DISPLAYOFF);
    _backlight = on;
}

void OledCharDisplay::setContrast(uint8_t contrast) {
    _oled.ssd1306_command(SSD1306_SETCONTRAST);
    _oled.ssd1306_command(contrast);
}
