/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef TEST_FAKES_H
#define TEST_FAKES_H

#include <string>
#include <vector>
#include "deadline_timer.h"
#include "display_device.h"
#include "system_status.h"

// Records every call made by DisplaySurface
class FakeDisplay : public DisplayDevice {
public:
    struct Write {
        int row;
        int col;
        std::string text;
    };

    FakeDisplay(int rows = 2, int cols = 16)
        : backlight(false), clears(0), backlightCalls(0), presents(0), _rows(rows), _cols(cols) {
        wipe();
    }

    int rows() const override { return _rows; }
    int cols() const override { return _cols; }

    void write(int row, int col, const std::string& text) override {
        writes.push_back({row, col, text});
        screen[row].replace(col, text.length(), text);
    }

    void present() override { presents++; }

    void clear() override {
        clears++;
        wipe();
    }

    bool getBacklight() const override { return backlight; }
    void setBacklight(bool on) override {
        backlight = on;
        backlightCalls++;
    }

    std::vector<Write> writes;
    std::vector<std::string> screen;
    bool backlight;
    int clears;
    int backlightCalls;
    int presents;

private:
    int _rows;
    int _cols;

    void wipe() { screen.assign(_rows, std::string(_cols, ' ')); }
};

// Time only moves when the test says so
class ManualClock : public Clock {
public:
    explicit ManualClock(uint32_t start = 1000) : now(start) {}

    uint32_t getMillis() override { return now; }
    void advance(uint32_t ms) { now += ms; }

    uint32_t now;
};

class FakeHost : public HostCommands {
public:
    void requestShutdown() override { calls.push_back("shutdown"); }
    void requestReboot() override { calls.push_back("reboot"); }
    void requestServiceStatus(const std::string& name) override { calls.push_back("service " + name); }
    void requestStatus() override { calls.push_back("status"); }

    std::vector<std::string> calls;
};

#endif // TEST_FAKES_H
