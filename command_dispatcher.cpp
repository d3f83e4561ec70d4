/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "command_dispatcher.h"
#include <ctype.h>

DispatchResult CommandDispatcher::handle(InputEvent evt) {
    switch (evt) {
        case EVT_UP:      _nav.doUp(); break;
        case EVT_PREV:    _nav.doPrev(); break;
        case EVT_NEXT:    _nav.doNext(); break;
        case EVT_ACTION:  _nav.doAction(); break;
        case EVT_REFRESH: _nav.display(); break;
        case EVT_QUIT:    return DISPATCH_QUIT;
        case EVT_UNKNOWN: return DISPATCH_HELP;
        case EVT_NONE:    break;
    }
    return DISPATCH_OK;
}

InputEvent CommandDispatcher::parseCommand(const std::string& command) {
    if (command.empty()) return EVT_REFRESH;

    // A lone space is the action key, so only line endings are stripped
    std::string cmd;
    for (char c : command) {
        if (c == '\r' || c == '\n') continue;
        cmd += (char)tolower((unsigned char)c);
    }

    if (cmd.empty()) return EVT_REFRESH;
    if (cmd == "quit") return EVT_QUIT;
    if (cmd.length() != 1) return EVT_UNKNOWN;

    switch (cmd[0]) {
        case '^': case 'u': case '6': return EVT_UP;
        case '<': case 'p': case ',': return EVT_PREV;
        case '>': case 'n': case '.': return EVT_NEXT;
        case '*': case 'x': case ' ': return EVT_ACTION;
        case 'q': return EVT_QUIT;
        default: return EVT_UNKNOWN;
    }
}

const char* CommandDispatcher::helpText() {
    return "^ u 6 : go (U)p the menu tree to the parent menu item\n"
           "> n . : (N)ext menu item\n"
           "< p , : (P)revious menu item\n"
           "* x   : e(X)ecute menu item or drill down into an item\n"
           "<cr>  : update the display\n"
           "q     : (Q)uit";
}

const char* CommandDispatcher::eventName(InputEvent evt) {
    switch (evt) {
        case EVT_UP:      return "up";
        case EVT_PREV:    return "prev";
        case EVT_NEXT:    return "next";
        case EVT_ACTION:  return "action";
        case EVT_QUIT:    return "quit";
        case EVT_REFRESH: return "refresh";
        case EVT_UNKNOWN: return "unknown";
        default:          return "none";
    }
}
