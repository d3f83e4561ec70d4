/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "ui.h"
#include "error_handler.h"
#include "hal.h"
#include "host_link.h"
#include "menu_data.h"
#include "settings.h"

UserInterface::UserInterface() {
    _session = nullptr;
}

UserInterface::~UserInterface() {
    delete _session;
}

void UserInterface::begin(DisplayDevice& device) {
    _input.begin();

    _session = new MenuSession(device, hal, settings.getBacklightDelayMs(),
                               settings.get().diffMergeGap);
    startSession();
}

void UserInterface::update() {
    // Poll input devices
    _input.update();

    // Process input events
    InputEvent evt = _input.getEvent();
    if (evt != EVT_NONE) dispatch(evt);

    // Timers (redraw, backlight)
    if (_session) _session->update();

    // Host link watchdog
    if (systemStatus.checkStale()) {
        errorHandler.report(ERR_HOST_TIMEOUT, "No status from host");
    }
}

bool UserInterface::startSession() {
    if (!_session) return false;

    // Fresh tree on every start, nothing carries over from the last session
    MenuContext ctx;
    ctx.status = &systemStatus;
    ctx.host = &hostLink;
    ctx.services = settings.getServiceNames();
    ctx.refreshRate = settings.get().defaultRefreshRate;
    ctx.scrollRate = settings.get().scrollRefreshRate;
    ctx.lastError = []() { return errorHandler.getLastError(); };

    bool ok = _session->begin([&ctx](MenuTree& tree) { return buildMenuTree(tree, ctx); });
    if (ok) hostLink.requestStatus();
    return ok;
}

void UserInterface::endSession() {
    if (_session) _session->end();
}

bool UserInterface::isActive() const {
    return _session && _session->isActive();
}

DispatchResult UserInterface::dispatch(InputEvent evt) {
    if (!_session) return DISPATCH_OK;

    // Any input wakes a closed menu
    if (!_session->isActive()) {
        if (SERIAL_MONITOR_ENABLE) Serial.println("Menu started");
        startSession();
        return DISPATCH_OK;
    }

    if (settings.get().mirrorToSerial) {
        Serial.print("Key: ");
        Serial.println(CommandDispatcher::eventName(evt));
    }

    DispatchResult result = _session->handle(evt);
    report(result);
    return result;
}

DispatchResult UserInterface::handleCommand(const std::string& command) {
    return dispatch(CommandDispatcher::parseCommand(command));
}

void UserInterface::report(DispatchResult result) {
    if (result == DISPATCH_HELP) {
        Serial.println(CommandDispatcher::helpText());
    } else if (result == DISPATCH_QUIT) {
        Serial.println("Menu closed");
    }
}

void UserInterface::applySettings() {
    if (!_session) return;
    _session->getScheduler().setBacklightDelay(settings.getBacklightDelayMs());
    _session->getSurface().setMergeGap(settings.get().diffMergeGap);
}

std::string UserInterface::describe() const {
    if (!isActive()) return "Menu: (closed)";
    return _session->getNavigator().describe();
}

bool UserInterface::isBacklightOn() const {
    return _session && _session->isActive() && _session->getSurface().isBacklightOn();
}
