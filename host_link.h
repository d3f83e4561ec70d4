/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef HOST_LINK_H
#define HOST_LINK_H

#include <Arduino.h>
#include "system_status.h"

/**
 * @brief Sends host actions as '!' lines on the serial port.
 *
 *   !shutdown   !reboot   !service <name>   !status
 *
 * The host agent executes them and answers with '@' status lines, which
 * handleSerialCommands() feeds into SystemStatus.
 */
class SerialHostLink : public HostCommands {
public:
    explicit SerialHostLink(Print& out) : _out(out) {}

    void requestShutdown() override;
    void requestReboot() override;
    void requestServiceStatus(const std::string& name) override;
    void requestStatus() override;

private:
    Print& _out;
};

#endif // HOST_LINK_H
