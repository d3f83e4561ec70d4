/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef MENU_DATA_H
#define MENU_DATA_H

#include <functional>
#include <string>
#include <vector>
#include "menu_system.h"
#include "system_status.h"

// Everything the menu items read from or act upon
struct MenuContext {
    SystemStatus* status;
    HostCommands* host;
    std::vector<std::string> services;
    float refreshRate; // Live values
    float scrollRate;  // Long text that scrolls
    std::function<std::string()> lastError; // Newest error log line, may be empty
};

// Builder Function: populates tree and returns the root item
MenuId buildMenuTree(MenuTree& tree, const MenuContext& ctx);

#endif // MENU_DATA_H
