/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "display_surface.h"

DisplaySurface::DisplaySurface(DisplayDevice& device, int mergeGap)
    : _device(device), _rows(device.rows()), _cols(device.cols()),
      _mergeGap(mergeGap < 0 ? 0 : mergeGap), _backlight(device.getBacklight()),
      _cursorRow(0), _cursorCol(0) {
    if (_rows < 0) _rows = 0;
    if (_cols < 0) _cols = 0;
    _desired.assign(_rows, std::string(_cols, ' '));
    _shadow.assign(_rows, std::string(_cols, ' '));
}

void DisplaySurface::setLine(int row, const std::string& text) {
    if (row < 0 || row >= _rows) return;

    std::string line = text.substr(0, _cols);
    line.resize(_cols, ' ');
    _desired[row] = line;
}

const std::string& DisplaySurface::getLine(int row) const {
    static const std::string empty;
    if (row < 0 || row >= _rows) return empty;
    return _desired[row];
}

const std::string& DisplaySurface::getShadow(int row) const {
    static const std::string empty;
    if (row < 0 || row >= _rows) return empty;
    return _shadow[row];
}

int DisplaySurface::flush() {
    int writes = 0;
    std::vector<Span> spans;

    for (int row = 0; row < _rows; row++) {
        if (_desired[row] == _shadow[row]) continue;

        diffSpans(_shadow[row], _desired[row], _mergeGap, spans);
        for (const auto& span : spans) {
            _device.write(row, span.start, _desired[row].substr(span.start, span.length));
            _cursorRow = row;
            _cursorCol = span.start + span.length;
            writes++;
        }
        _shadow[row] = _desired[row];
    }

    if (writes > 0) _device.present();
    return writes;
}

void DisplaySurface::clear() {
    for (int row = 0; row < _rows; row++) {
        _desired[row].assign(_cols, ' ');
        _shadow[row].assign(_cols, ' ');
    }
    _device.clear();
    _cursorRow = 0;
    _cursorCol = 0;
}

void DisplaySurface::setBacklight(bool on) {
    if (on == _backlight) return;
    _device.setBacklight(on);
    _backlight = on;
}

void DisplaySurface::diffSpans(const std::string& before, const std::string& after,
                               int mergeGap, std::vector<Span>& spans) {
    spans.clear();

    // Anything past the shorter line counts as changed
    const int common = (int)(before.size() < after.size() ? before.size() : after.size());
    const int n = (int)after.size();
    auto differs = [&](int i) { return i >= common || before[i] != after[i]; };

    int i = 0;
    while (i < n) {
        if (!differs(i)) {
            i++;
            continue;
        }

        int start = i;
        int end = i + 1;
        int j = end;
        while (j < n) {
            if (differs(j)) {
                end = ++j;
                continue;
            }
            // Measure the unchanged gap and bridge it if it is short enough
            int k = j;
            while (k < n && !differs(k)) k++;
            if (k >= n || k - j > mergeGap) break;
            j = k;
        }

        spans.push_back({start, end - start});
        i = j;
    }
}
