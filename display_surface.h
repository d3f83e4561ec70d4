/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef DISPLAY_SURFACE_H
#define DISPLAY_SURFACE_H

#include <string>
#include <vector>
#include "display_device.h"

/**
 * @brief Buffered view of a DisplayDevice.
 *
 * Keeps the desired content and a shadow of what was last written so that
 * flush() only sends the characters that changed. Nearby changes are merged
 * into one write when the unchanged gap between them is at most mergeGap.
 */
class DisplaySurface {
public:
    struct Span {
        int start;
        int length;
    };

    DisplaySurface(DisplayDevice& device, int mergeGap);

    int rows() const { return _rows; }
    int cols() const { return _cols; }

    // Stores desired content, padded or truncated to the line width
    void setLine(int row, const std::string& text);
    const std::string& getLine(int row) const;
    const std::string& getShadow(int row) const;

    // Writes changed spans to the device and presents them once.
    // Returns the number of writes.
    int flush();
    void clear();

    void setBacklight(bool on);
    bool isBacklightOn() const { return _backlight; }

    void setMergeGap(int gap) { _mergeGap = gap < 0 ? 0 : gap; }

    int getCursorRow() const { return _cursorRow; }
    int getCursorCol() const { return _cursorCol; }

    // Changed regions between two equal length lines
    static void diffSpans(const std::string& before, const std::string& after,
                          int mergeGap, std::vector<Span>& spans);

private:
    DisplayDevice& _device;
    int _rows;
    int _cols;
    int _mergeGap;
    bool _backlight;
    int _cursorRow;
    int _cursorCol;
    std::vector<std::string> _desired;
    std::vector<std::string> _shadow;
};

#endif // DISPLAY_SURFACE_H
