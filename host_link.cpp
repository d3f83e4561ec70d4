/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "host_link.h"

void SerialHostLink::requestShutdown() {
    _out.println("!shutdown");
}

void SerialHostLink::requestReboot() {
    _out.println("!reboot");
}

void SerialHostLink::requestServiceStatus(const std::string& name) {
    _out.print("!service ");
    _out.println(name.c_str());
}

void SerialHostLink::requestStatus() {
    _out.println("!status");
}
