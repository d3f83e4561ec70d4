/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "line_formatter.h"

std::string rotateText(const std::string& message, int width, uint32_t tick) {
    if (width <= 0) return std::string();

    // message + separator + message, read through a sliding window
    std::string doubled = message;
    doubled += SCROLL_SEPARATOR;
    doubled += message;

    size_t start = tick % (message.length() + 1);
    std::string window = doubled.substr(start, width);
    window.resize(width, ' ');
    return window;
}

std::string formatLine(const std::string& message,
                       const std::string& pre,
                       const std::string& post,
                       int width,
                       Justify just,
                       uint32_t tick) {
    if (width <= 0) return std::string();

    int room = width - (int)pre.length() - (int)post.length();
    if (room <= 0) {
        // Glyphs alone fill the line
        std::string line = (pre + post).substr(0, width);
        line.resize(width, ' ');
        return line;
    }

    std::string body;
    if ((int)message.length() > room) {
        body = rotateText(message, room, tick);
    } else {
        int pad = room - (int)message.length();
        int left = 0;
        if (just == JUSTIFY_CENTER) left = pad / 2;
        else if (just == JUSTIFY_RIGHT) left = pad;

        body.assign(left, ' ');
        body += message;
        body.append(pad - left, ' ');
    }

    return pre + body + post;
}
