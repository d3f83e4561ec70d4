/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "menu_session.h"

MenuSession::MenuSession(DisplayDevice& device, Clock& clock, uint32_t backlightDelayMs, int mergeGap)
    : _surface(device, mergeGap), _nav(_tree), _scheduler(_surface, clock, backlightDelayMs),
      _dispatcher(_nav), _active(false) {
    _nav.setObserver(&_scheduler);
}

MenuSession::~MenuSession() {
    end();
}

bool MenuSession::begin(const TreeBuilder& builder) {
    end();

    _tree.clear();
    MenuId root = builder ? builder(_tree) : MENU_NONE;
    if (!_tree.getItem(root)) return false;

    _surface.clear();
    _active = true;
    _nav.push(root);
    return true;
}

void MenuSession::end() {
    if (!_active) return;
    _active = false;
    _scheduler.shutdown();
    _nav.clear();
}

void MenuSession::update() {
    if (!_active) return;
    _scheduler.update(_nav);
}

DispatchResult MenuSession::handle(InputEvent evt) {
    if (!_active) return DISPATCH_OK;

    DispatchResult result = _dispatcher.handle(evt);
    if (result == DISPATCH_QUIT) end();
    return result;
}

DispatchResult MenuSession::handleCommand(const std::string& command) {
    return handle(CommandDispatcher::parseCommand(command));
}
