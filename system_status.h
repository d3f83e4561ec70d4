/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef SYSTEM_STATUS_H
#define SYSTEM_STATUS_H

#include <stdint.h>
#include <map>
#include <string>
#include "deadline_timer.h"

/**
 * @brief Actions executed on the host computer.
 *
 * Opaque to the menu: they may take time and may change host state, and
 * the menu redraws after calling them.
 */
class HostCommands {
public:
    virtual ~HostCommands() {}

    virtual void requestShutdown() = 0;
    virtual void requestReboot() = 0;
    virtual void requestServiceStatus(const std::string& name) = 0;
    virtual void requestStatus() = 0;
};

/**
 * @brief Cache of host facts received over the serial link.
 *
 * Accepted lines:
 *   @hostname <name>      @ip <address>        @clock <unix seconds>
 *   @uptime <seconds>     @load <1m> <5m> <15m>
 *   @runlevel <text>      @service <name> <state>
 *
 * Clock and uptime keep counting from the local millisecond clock between
 * updates.
 */
class SystemStatus {
public:
    explicit SystemStatus(Clock& clock);

    // Returns false for lines that are not well formed host updates
    bool parseLine(const std::string& line);
    void clear();

    std::string getHostname() const;
    std::string getIpAddress() const;
    std::string getTime() const;
    std::string getDate() const;
    std::string getUptime() const;
    std::string getLoad() const;
    std::string getRunlevel() const;
    std::string getServiceState(const std::string& name) const;

    bool hasHost() const { return _updates > 0; }
    uint32_t getUpdateCount() const { return _updates; }

    // True when no update arrived within HOST_STALE_MS
    bool isStale() const;

    // True exactly once each time the link goes stale
    bool checkStale();

    static std::string formatDuration(uint32_t seconds);

private:
    Clock& _clock;

    std::string _hostname;
    std::string _ip;
    std::string _load;
    std::string _runlevel;
    std::map<std::string, std::string> _services;

    bool _hasClock;
    int64_t _clockEpoch;
    uint32_t _clockAt;

    bool _hasUptime;
    uint32_t _uptime;
    uint32_t _uptimeAt;

    uint32_t _updates;
    uint32_t _lastUpdate;
    bool _staleReported;

    int64_t currentEpoch() const;
};

#endif // SYSTEM_STATUS_H
