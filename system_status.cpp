/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "system_status.h"
#include "config.h"
#include <stdio.h>
#include <stdlib.h>
#include <time.h>

namespace {

// Splits "key rest of line", trimming surrounding whitespace
void splitKey(const std::string& text, std::string& key, std::string& rest) {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) {
        key.clear();
        rest.clear();
        return;
    }
    size_t space = text.find_first_of(" \t", start);
    key = text.substr(start, space == std::string::npos ? std::string::npos : space - start);

    rest.clear();
    if (space == std::string::npos) return;
    size_t valueStart = text.find_first_not_of(" \t", space);
    if (valueStart == std::string::npos) return;
    size_t valueEnd = text.find_last_not_of(" \t\r\n");
    rest = text.substr(valueStart, valueEnd - valueStart + 1);
}

bool parseInt64(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    long long v = strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return false;
    out = (int64_t)v;
    return true;
}

} // namespace

SystemStatus::SystemStatus(Clock& clock) : _clock(clock) {
    clear();
}

void SystemStatus::clear() {
    _hostname.clear();
    _ip.clear();
    _load.clear();
    _runlevel.clear();
    _services.clear();
    _hasClock = false;
    _clockEpoch = 0;
    _clockAt = 0;
    _hasUptime = false;
    _uptime = 0;
    _uptimeAt = 0;
    _updates = 0;
    _lastUpdate = 0;
    _staleReported = false;
}

bool SystemStatus::parseLine(const std::string& line) {
    if (line.empty() || line[0] != '@') return false;

    std::string key, value;
    splitKey(line.substr(1), key, value);
    if (key.empty() || value.empty()) return false;

    uint32_t now = _clock.getMillis();

    if (key == "hostname") {
        // Short name only, as shown by `hostname -s`
        _hostname = value.substr(0, value.find('.'));
    } else if (key == "ip") {
        _ip = value;
    } else if (key == "clock") {
        int64_t epoch;
        if (!parseInt64(value, epoch) || epoch < 0) return false;
        _clockEpoch = epoch;
        _clockAt = now;
        _hasClock = true;
    } else if (key == "uptime") {
        int64_t secs;
        if (!parseInt64(value, secs) || secs < 0 || secs > 0xFFFFFFFFLL) return false;
        _uptime = (uint32_t)secs;
        _uptimeAt = now;
        _hasUptime = true;
    } else if (key == "load") {
        _load = value;
    } else if (key == "runlevel") {
        _runlevel = value;
    } else if (key == "service") {
        std::string name, state;
        splitKey(value, name, state);
        if (name.empty() || state.empty()) return false;
        _services[name] = state;
    } else {
        return false;
    }

    _updates++;
    _lastUpdate = now;
    _staleReported = false;
    return true;
}

std::string SystemStatus::getHostname() const {
    return _hostname.empty() ? std::string("unknown") : _hostname;
}

std::string SystemStatus::getIpAddress() const {
    // Loopback until the host tells us otherwise
    return _ip.empty() ? std::string("127.0.0.1") : _ip;
}

int64_t SystemStatus::currentEpoch() const {
    uint32_t elapsed = _clock.getMillis() - _clockAt;
    return _clockEpoch + elapsed / 1000;
}

std::string SystemStatus::getTime() const {
    if (!_hasClock) return "--:--:--";

    time_t t = (time_t)currentEpoch();
    struct tm tmv;
    gmtime_r(&t, &tmv);

    char buf[16];
    strftime(buf, sizeof(buf), "%H:%M:%S", &tmv);
    return buf;
}

std::string SystemStatus::getDate() const {
    if (!_hasClock) return "----------";

    time_t t = (time_t)currentEpoch();
    struct tm tmv;
    gmtime_r(&t, &tmv);

    char buf[16];
    strftime(buf, sizeof(buf), "%Y-%m-%d", &tmv);
    return buf;
}

std::string SystemStatus::getUptime() const {
    if (!_hasUptime) return "?";
    uint32_t elapsed = (_clock.getMillis() - _uptimeAt) / 1000;
    return formatDuration(_uptime + elapsed);
}

std::string SystemStatus::getLoad() const {
    return _load.empty() ? std::string("?") : _load;
}

std::string SystemStatus::getRunlevel() const {
    return "Runlevel: " + (_runlevel.empty() ? std::string("?") : _runlevel);
}

std::string SystemStatus::getServiceState(const std::string& name) const {
    auto it = _services.find(name);
    if (it == _services.end()) return "unknown";
    return it->second;
}

bool SystemStatus::isStale() const {
    if (_updates == 0) return false;
    return _clock.getMillis() - _lastUpdate > HOST_STALE_MS;
}

bool SystemStatus::checkStale() {
    if (!isStale() || _staleReported) return false;
    _staleReported = true;
    return true;
}

std::string SystemStatus::formatDuration(uint32_t seconds) {
    uint32_t days = seconds / 86400;
    uint32_t hours = (seconds % 86400) / 3600;
    uint32_t mins = (seconds % 3600) / 60;
    uint32_t secs = seconds % 60;

    char buf[24];
    if (days > 0) {
        snprintf(buf, sizeof(buf), "%lud %02lu:%02lu", (unsigned long)days,
                 (unsigned long)hours, (unsigned long)mins);
    } else {
        snprintf(buf, sizeof(buf), "%02lu:%02lu:%02lu", (unsigned long)hours,
                 (unsigned long)mins, (unsigned long)secs);
    }
    return buf;
}
