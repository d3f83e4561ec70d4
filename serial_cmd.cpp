/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "serial_cmd.h"
#include "display_oled.h"
#include "error_handler.h"
#include "system_status.h"
#include "update_scheduler.h"
#include "ui.h"

// --- CLI Registry ---
struct SettingItem {
    String name;
    std::function<String()> get;
    std::function<void(String)> set;
};

std::vector<SettingItem> registry;
bool cliInitialized = false;

static void addServiceSlot(uint8_t slot) {
    String name = "service";
    name += (slot + 1);
    registry.push_back({ name,
        [slot]() { return String(settings.get().serviceNames[slot]); },
        [slot](String v) { settings.setServiceName(slot, v == "-" ? "" : v.c_str()); }
    });
}

void initCLI() {
    if (cliInitialized) return;

    // --- Display Timing ---
    registry.push_back({ "backlight",
        []() { return String(settings.get().backlightDelay); },
        [](String v) {
            settings.get().backlightDelay = constrain(v.toInt(), 0, 3600);
            ui.applySettings();
        }
    });

    registry.push_back({ "refresh",
        []() { return String(settings.get().defaultRefreshRate); },
        [](String v) { settings.get().defaultRefreshRate = UpdateScheduler::clampRefreshRate(v.toFloat()); }
    });

    registry.push_back({ "scroll",
        []() { return String(settings.get().scrollRefreshRate); },
        [](String v) { settings.get().scrollRefreshRate = UpdateScheduler::clampRefreshRate(v.toFloat()); }
    });

    registry.push_back({ "merge_gap",
        []() { return String(settings.get().diffMergeGap); },
        [](String v) {
            settings.get().diffMergeGap = constrain(v.toInt(), 0, LCD_COLS);
            ui.applySettings();
        }
    });

    // --- Panel ---
    registry.push_back({ "contrast",
        []() { return String(settings.get().displayContrast); },
        [](String v) {
            settings.get().displayContrast = constrain(v.toInt(), 0, 255);
            oledDisplay.setContrast(settings.get().displayContrast);
        }
    });

    registry.push_back({ "require_display",
        []() { return String(settings.get().requireDisplay); },
        [](String v) { settings.get().requireDisplay = (v == "1" || v == "true"); }
    });

    registry.push_back({ "mirror",
        []() { return String(settings.get().mirrorToSerial); },
        [](String v) {
            settings.get().mirrorToSerial = (v == "1" || v == "true");
            oledDisplay.setMirror(settings.get().mirrorToSerial);
        }
    });

    // --- Services Menu ---
    // Takes effect when the next session builds its tree
    for (uint8_t i = 0; i < MAX_SERVICES; i++) addServiceSlot(i);

    cliInitialized = true;
}

// Returns true when the line was a console command
static bool handleConsoleCommand(const String& input) {
    if (input == "status" || input == "i") {
        printStatus();
    }
    else if (input == "help") {
        printHelp();
    }
    else if (input == "save") {
        settings.save(true);
    }
    else if (input == "factory") {
        Serial.println("Factory Resetting...");
        settings.factoryReset();
        ui.applySettings();
    }
    else if (input == "error dump") {
        errorHandler.dumpLog(Serial);
    }
    else if (input == "error clear") {
        errorHandler.clearLogs();
        Serial.println("Error Log Cleared");
    }

    // --- Registry Commands ---
    else if (input == "list") {
        Serial.println("--- Settings List ---");
        for (const auto& item : registry) {
            Serial.print(item.name);
            Serial.print(" = ");
            Serial.println(item.get());
        }
        Serial.println("---------------------");
    }
    else if (input.startsWith("set ")) {
        int firstSpace = input.indexOf(' ');
        int secondSpace = input.indexOf(' ', firstSpace + 1);

        if (secondSpace > 0) {
            String key = input.substring(firstSpace + 1, secondSpace);
            String valStr = input.substring(secondSpace + 1);

            bool found = false;
            for (const auto& item : registry) {
                if (item.name == key) {
                    item.set(valStr);
                    Serial.print("Set "); Serial.print(key); Serial.print(" = "); Serial.println(item.get());
                    found = true;
                    break;
                }
            }
            if (!found) Serial.println("Unknown setting key");
        } else {
            Serial.println("Usage: set <key> <value>");
        }
    }
    else if (input.startsWith("get ")) {
        String key = input.substring(4);
        bool found = false;
        for (const auto& item : registry) {
            if (item.name == key) {
                Serial.println(item.get());
                found = true;
                break;
            }
        }
        if (!found) Serial.println("Unknown setting key");
    }
    else {
        return false;
    }
    return true;
}

void handleSerialCommands() {
    if (!cliInitialized) initCLI();

    if (Serial.available() > 0) {
        String raw = Serial.readStringUntil('\n');
        raw.replace("\r", "");

        String input = raw;
        input.trim();

        // A line of blanks is the space key (Action)
        if (input.length() == 0 && raw.length() > 0) input = " ";

        // --- Host Updates ---
        if (input.startsWith("@")) {
            if (!systemStatus.parseLine(input.c_str())) {
                Serial.print("Ignored host line: ");
                Serial.println(input);
            }
            return;
        }

        if (handleConsoleCommand(input)) return;

        // --- Menu Keystrokes ---
        if (ui.handleCommand(input.c_str()) == DISPATCH_HELP) {
            Serial.println("Type 'help' for console commands.");
        }
    }
}

void printStatus() {
    Serial.println("--- SysMenu Status ---");
    Serial.print("Firmware: ");
    Serial.println(FIRMWARE_VERSION);

    Serial.println(ui.describe().c_str());

    Serial.print("Backlight: ");
    Serial.println(ui.isBacklightOn() ? "ON" : "OFF");

    Serial.print("Host: ");
    if (!systemStatus.hasHost()) Serial.println("not connected");
    else if (systemStatus.isStale()) Serial.println("STALE");
    else Serial.println(systemStatus.getHostname().c_str());

    Serial.print("Uptime: ");
    Serial.println(systemStatus.getUptime().c_str());

    Serial.print("Last Error: ");
    std::string lastError = errorHandler.getLastError();
    Serial.println(lastError.empty() ? "none" : lastError.c_str());
    if (errorHandler.hasCriticalError()) Serial.println("CRITICAL ERROR since boot");

    Serial.println("----------------------");
}

void printHelp() {
    if (!cliInitialized) initCLI();

    Serial.println("Available Commands:");
    Serial.println("status, i - Show status");
    Serial.println("list - List all settings");
    Serial.println("set <key> <val> - Set setting");
    Serial.println("get <key> - Get setting");
    Serial.println("save - Persist settings");
    Serial.println("error dump, error clear");
    Serial.println("factory - Factory Reset");
    Serial.println(CommandDispatcher::helpText());
}
