/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "menu_data.h"
#include "navigator.h"
#include <stdio.h>

// --- Information Page ---
static MenuId buildInformation(MenuTree& tree, const MenuContext& ctx) {
    SystemStatus* status = ctx.status;

    MenuId info = tree.addItem("Information",
        TextProvider([status](const Navigator&) { return status->getHostname(); }),
        nullptr, ctx.refreshRate);

    tree.link(info, {
        tree.addItem("IP Address",
            TextProvider([status](const Navigator&) { return status->getIpAddress(); }),
            nullptr, ctx.refreshRate),
        tree.addItem("Time",
            TextProvider([status](const Navigator&) { return status->getTime(); }),
            nullptr, ctx.refreshRate),
        tree.addItem("Date",
            TextProvider([status](const Navigator&) { return status->getDate(); }),
            nullptr, ctx.refreshRate),
        tree.addItem("Uptime",
            TextProvider([status](const Navigator&) { return status->getUptime(); }),
            nullptr, ctx.refreshRate),
        tree.addItem("Load",
            TextProvider([status](const Navigator&) { return status->getLoad(); }),
            nullptr, ctx.scrollRate)
    });
    return info;
}

// --- System Page ---
static MenuId buildSystem(MenuTree& tree, const MenuContext& ctx) {
    SystemStatus* status = ctx.status;
    HostCommands* host = ctx.host;
    std::function<std::string()> lastError = ctx.lastError;

    MenuId system = tree.addItem("System", "", nullptr, ctx.refreshRate);

    tree.link(system, {
        tree.addItem("System", "Shutdown",
            [host](Navigator&) { host->requestShutdown(); }, ctx.refreshRate),
        tree.addItem("System", "Reboot",
            [host](Navigator&) { host->requestReboot(); }, ctx.refreshRate),
        tree.addItem("Run level",
            TextProvider([status](const Navigator&) { return status->getRunlevel(); }),
            [host](Navigator&) { host->requestStatus(); }, ctx.refreshRate),
        tree.addItem("Error Log",
            TextProvider([lastError](const Navigator&) {
                std::string line = lastError ? lastError() : std::string();
                return line.empty() ? std::string("No errors") : line;
            }),
            nullptr, ctx.scrollRate),
        tree.addItem("Firmware", FIRMWARE_VERSION, nullptr, 0.0f)
    });
    return system;
}

// --- Services Page ---
static MenuId buildServices(MenuTree& tree, const MenuContext& ctx) {
    SystemStatus* status = ctx.status;
    HostCommands* host = ctx.host;

    char summary[24];
    snprintf(summary, sizeof(summary), "%u configured", (unsigned)ctx.services.size());
    MenuId services = tree.addItem("Services", summary, nullptr, ctx.refreshRate);

    std::vector<MenuId> items;
    for (const auto& name : ctx.services) {
        // Selecting a service asks the host for a fresh state
        items.push_back(tree.addItem(name,
            TextProvider([status, name](const Navigator&) { return status->getServiceState(name); }),
            [host, name](Navigator&) { host->requestServiceStatus(name); },
            ctx.refreshRate));
    }
    if (items.empty()) {
        items.push_back(tree.addItem("Services", NO_SERVICES_MESSAGE, nullptr, 0.0f));
    }

    tree.link(services, items);
    return services;
}

// --- Menu Builder ---
MenuId buildMenuTree(MenuTree& tree, const MenuContext& ctx) {
    tree.clear();

    MenuId info = buildInformation(tree, ctx);
    MenuId system = buildSystem(tree, ctx);
    MenuId services = buildServices(tree, ctx);

    return tree.link(MENU_NONE, { info, system, services });
}
