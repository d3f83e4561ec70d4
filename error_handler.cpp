/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "error_handler.h"

ErrorHandler errorHandler;

ErrorHandler::ErrorHandler() {
    _criticalError = false;
    _fsReady = false;
}

void ErrorHandler::begin() {
    // Filesystem is mounted by the Settings class before this is called
    _fsReady = true;

    // Seed the menu with the newest persisted entry
    std::vector<String> lines;
    getLogLines(lines);
    if (!lines.empty()) _lastError = lines.back().c_str();
}

void ErrorHandler::report(ErrorCode code, const char* message, bool critical) {
    if (critical) _criticalError = true;

    // 1. Log to Serial Console for debugging
    Serial.print("ERROR ");
    Serial.print(code);
    Serial.print(": ");
    Serial.println(message);

    // 2. Append to persistent log file
    logToFile(code, message);

    // 3. Remember for the UI
    char buf[16];
    snprintf(buf, sizeof(buf), "E%d: ", (int)code);
    _lastError = buf;
    _lastError += message;
}

void ErrorHandler::logToFile(ErrorCode code, const char* message) {
    // Errors raised before the filesystem is mounted only reach Serial
    if (!_fsReady) return;

    // Check file size first
    File f = LittleFS.open("/error.log", "r");
    if (f) {
        size_t size = f.size();
        f.close();

        // Rotate if > 10KB
        if (size > 10240) {
            LittleFS.remove("/error.bak");
            LittleFS.rename("/error.log", "/error.bak");
        }
    }

    f = LittleFS.open("/error.log", "a");
    if (f) {
        f.print(hal.getMillis());
        f.print(",");
        f.print(code);
        f.print(",");
        f.println(message);
        f.close();
    }
}

void ErrorHandler::clearLogs() {
    LittleFS.remove("/error.log");
    _lastError.clear();
}

void ErrorHandler::dumpLog(Stream& out) {
    File f = LittleFS.open("/error.log", "r");
    if (!f) {
        out.println("No log file.");
        return;
    }

    while (f.available()) {
        out.write(f.read());
    }
    f.close();
}

void ErrorHandler::getLogLines(std::vector<String>& lines, int maxLines) {
    File f = LittleFS.open("/error.log", "r");
    if (!f) return;

    // Keep the newest maxLines entries
    while (f.available()) {
        String line = f.readStringUntil('\n');
        line.trim();
        if (line.length() > 0) {
            lines.push_back(line);
            if ((int)lines.size() > maxLines) lines.erase(lines.begin());
        }
    }
    f.close();
}
