/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "settings.h"
#include "error_handler.h"
#include "update_scheduler.h"

Settings::Settings() {
    setDefaults();
}

bool Settings::begin() {
    // Mount the filesystem
    if (!LittleFS.begin()) {
        Serial.println("LittleFS Mount Failed. Formatting...");
        LittleFS.format();
        if (!LittleFS.begin()) {
            errorHandler.report(ERR_FS_FAILURE, "LittleFS mount failed", true);
            return false;
        }
    }
    load();
    return true;
}

void Settings::load() {
    if (LittleFS.exists(_filename)) {
        File f = LittleFS.open(_filename, "r");
        if (f) {
            uint32_t version;
            if (f.read((uint8_t*)&version, sizeof(version)) == sizeof(version)) {
                // Rewind to start
                f.seek(0);

                if (version != SETTINGS_SCHEMA_VERSION) {
                    Serial.print("Settings schema v");
                    Serial.print(version);
                    Serial.println(" not supported. Resetting defaults.");
                } else if (f.read((uint8_t*)&_data, sizeof(GlobalSettings)) == sizeof(GlobalSettings)) {
                    Serial.println("Settings loaded.");
                    validate();
                    f.close();
                    return;
                } else {
                    errorHandler.report(ERR_SETTINGS_CORRUPT, "Settings file truncated");
                }
            }
            f.close();
        }
    }

    Serial.println("Settings not found or invalid. Using defaults.");
    resetDefaults();
}

void Settings::save(bool verbose) {
    File f = LittleFS.open(_filename, "w");
    if (!f) {
        errorHandler.report(ERR_FS_FAILURE, "Cannot write settings");
        return;
    }
    f.write((uint8_t*)&_data, sizeof(GlobalSettings));
    f.close();

    if (verbose) Serial.println("Settings saved.");
}

void Settings::resetDefaults() {
    setDefaults();
    save();
}

void Settings::factoryReset() {
    LittleFS.remove(_filename);
    errorHandler.clearLogs();
    resetDefaults();
    Serial.println("Factory reset complete.");
}

void Settings::setDefaults() {
    memset(&_data, 0, sizeof(GlobalSettings));
    _data.schemaVersion = SETTINGS_SCHEMA_VERSION;

    _data.backlightDelay = DEFAULT_BACKLIGHT_DELAY;
    _data.defaultRefreshRate = DEFAULT_REFRESH_RATE;
    _data.scrollRefreshRate = DEFAULT_SCROLL_RATE;
    _data.diffMergeGap = DEFAULT_DIFF_MERGE_GAP;
    _data.displayContrast = DEFAULT_CONTRAST;
    _data.requireDisplay = false;
    _data.mirrorToSerial = false;

    // Default service is this menu's own unit on the host
    strncpy(_data.serviceNames[0], "sysmenu", SERVICE_NAME_LENGTH);
}

void Settings::validate() {
    bool changed = false;

    if (_data.backlightDelay > 3600) { _data.backlightDelay = DEFAULT_BACKLIGHT_DELAY; changed = true; }

    // Refresh rates are redraws per second, 0 disables periodic redraw
    if (!(_data.defaultRefreshRate >= 0.0f && _data.defaultRefreshRate <= MAX_REFRESH_RATE)) {
        _data.defaultRefreshRate = DEFAULT_REFRESH_RATE;
        changed = true;
    } else if (UpdateScheduler::clampRefreshRate(_data.defaultRefreshRate) != _data.defaultRefreshRate) {
        _data.defaultRefreshRate = MIN_REFRESH_RATE;
        changed = true;
    }
    if (!(_data.scrollRefreshRate >= 0.0f && _data.scrollRefreshRate <= MAX_REFRESH_RATE)) {
        _data.scrollRefreshRate = DEFAULT_SCROLL_RATE;
        changed = true;
    } else if (UpdateScheduler::clampRefreshRate(_data.scrollRefreshRate) != _data.scrollRefreshRate) {
        _data.scrollRefreshRate = MIN_REFRESH_RATE;
        changed = true;
    }
    if (_data.diffMergeGap > LCD_COLS) { _data.diffMergeGap = DEFAULT_DIFF_MERGE_GAP; changed = true; }

    // Force null termination of service names
    for (int i = 0; i < MAX_SERVICES; i++) {
        _data.serviceNames[i][SERVICE_NAME_LENGTH] = 0;
    }

    if (changed) {
        errorHandler.report(ERR_SETTINGS_CORRUPT, "Settings out of range, defaults applied");
    }
}

std::vector<std::string> Settings::getServiceNames() const {
    std::vector<std::string> names;
    for (int i = 0; i < MAX_SERVICES; i++) {
        if (_data.serviceNames[i][0] != 0) names.push_back(_data.serviceNames[i]);
    }
    return names;
}

void Settings::setServiceName(uint8_t slot, const char* name) {
    if (slot >= MAX_SERVICES) return;
    strncpy(_data.serviceNames[slot], name, SERVICE_NAME_LENGTH);
    _data.serviceNames[slot][SERVICE_NAME_LENGTH] = 0; // Ensure null termination
}
