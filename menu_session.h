/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef MENU_SESSION_H
#define MENU_SESSION_H

#include <functional>
#include "command_dispatcher.h"
#include "display_surface.h"
#include "menu_system.h"
#include "navigator.h"
#include "update_scheduler.h"

/**
 * @brief One run of the menu, from first draw to blank display.
 *
 * Owns the tree, navigator, surface, scheduler and dispatcher and wires them
 * together. end() (also run on destruction) cancels the timers, turns the
 * backlight off and clears the display however the session finished.
 */
class MenuSession {
public:
    typedef std::function<MenuId(MenuTree&)> TreeBuilder;

    MenuSession(DisplayDevice& device, Clock& clock, uint32_t backlightDelayMs, int mergeGap);
    ~MenuSession();

    // Builds a fresh tree and shows its root
    bool begin(const TreeBuilder& builder);
    void end();
    bool isActive() const { return _active; }

    // Polls timers, call from the main loop
    void update();

    // Routes an input event; ends the session on EVT_QUIT
    DispatchResult handle(InputEvent evt);
    DispatchResult handleCommand(const std::string& command);

    Navigator& getNavigator() { return _nav; }
    const Navigator& getNavigator() const { return _nav; }
    UpdateScheduler& getScheduler() { return _scheduler; }
    DisplaySurface& getSurface() { return _surface; }
    const MenuTree& getTree() const { return _tree; }

private:
    MenuTree _tree;
    DisplaySurface _surface;
    Navigator _nav;
    UpdateScheduler _scheduler;
    CommandDispatcher _dispatcher;
    bool _active;

    MenuSession(const MenuSession&) = delete;
    MenuSession& operator=(const MenuSession&) = delete;
};

#endif // MENU_SESSION_H
