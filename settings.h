/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef SETTINGS_H
#define SETTINGS_H

#include <Arduino.h>
#include <LittleFS.h>
#include <string>
#include <vector>
#include "types.h"
#include "config.h"

/**
 * @brief Manages persistent configuration using LittleFS.
 *
 * Handles:
 * - Loading/Saving global settings
 * - Range validation of loaded values
 * - Factory reset
 * - Service list used by the Services menu
 */
class Settings {
public:
    Settings();

    bool begin();
    void load();
    void save(bool verbose = false);
    void resetDefaults();
    void factoryReset();

    // Accessor for the global settings struct
    GlobalSettings& get() { return _data; }

    // Backlight idle timeout in milliseconds (0 = always on)
    uint32_t getBacklightDelayMs() const { return (uint32_t)_data.backlightDelay * 1000UL; }

    // --- Service List ---
    std::vector<std::string> getServiceNames() const;
    void setServiceName(uint8_t slot, const char* name);

private:
    GlobalSettings _data;
    const char* _filename = "/settings.bin";

    void validate();
    void setDefaults();
};

#endif // SETTINGS_H
