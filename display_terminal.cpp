/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "display_terminal.h"

TerminalDisplay::TerminalDisplay(Print& out) : _out(out), _backlight(true) {}

char TerminalDisplay::toAscii(char c) {
    switch ((uint8_t)c) {
        case GLYPH_UP:       return '^';
        case GLYPH_SIBLINGS: return '~';
        case GLYPH_ACTION:   return '*';
    }
    if ((uint8_t)c < 0x20 || (uint8_t)c > 0x7E) return '?';
    return c;
}

void TerminalDisplay::write(int row, int col, const std::string& text) {
    if (row < 0 || row >= LCD_ROWS || col < 0 || col >= LCD_COLS) return;

    // Save cursor, move to the cell (1-based), write, restore
    _out.print("\x1b" "7");
    _out.print("\x1b[");
    _out.print(row + 1);
    _out.print(";");
    _out.print(col + 1);
    _out.print("H");

    for (size_t i = 0; i < text.length() && col + (int)i < LCD_COLS; i++) {
        _out.print(toAscii(text[i]));
    }
    _out.print("\x1b" "8");
}

void TerminalDisplay::clear() {
    _out.print("\x1b[2J\x1b[H");
}
