/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef ERROR_HANDLER_H
#define ERROR_HANDLER_H

#include <Arduino.h>
#include <LittleFS.h>
#include <string>
#include <vector>
#include "hal.h"

enum ErrorCode {
    ERR_NONE = 0,
    ERR_DISPLAY_MISSING = 1,
    ERR_SETTINGS_CORRUPT = 2,
    ERR_FS_FAILURE = 3,
    ERR_HOST_TIMEOUT = 4,
    ERR_WATCHDOG_RESET = 5
};

/**
 * @brief Centralized Error Handling and Logging.
 *
 * Capabilities:
 * - Logs errors to Serial console
 * - Appends errors to persistent file (/error.log)
 * - Keeps the newest entry for the "Error Log" menu item
 * - Tracks critical system state
 */
class ErrorHandler {
public:
    ErrorHandler();

    void begin();

    // Report an error occurrence
    void report(ErrorCode code, const char* message, bool critical = false);

    // Clear all persistent logs
    void clearLogs();

    // Stream entire log to output (e.g. Serial)
    void dumpLog(Stream& out);

    // Retrieve log lines for display
    void getLogLines(std::vector<String>& lines, int maxLines = 50);

    // Newest entry as "<code>: <message>", empty when none
    std::string getLastError() const { return _lastError; }

    // Check if a critical error has occurred since boot
    bool hasCriticalError() { return _criticalError; }

private:
    bool _criticalError;
    bool _fsReady;
    std::string _lastError;

    void logToFile(ErrorCode code, const char* message);
};

extern ErrorHandler errorHandler;

#endif // ERROR_HANDLER_H
