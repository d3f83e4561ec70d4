/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef LINE_FORMATTER_H
#define LINE_FORMATTER_H

#include <stdint.h>
#include <string>
#include "types.h"

/**
 * @brief Builds a fixed-width display line.
 *
 * The body is justified between the prefix and suffix glyphs. Messages
 * wider than the body scroll left one character per tick, wrapping through
 * SCROLL_SEPARATOR, and repeat every (message length + 1) ticks.
 *
 * The result is always exactly `width` characters (empty for width <= 0).
 */
std::string formatLine(const std::string& message,
                       const std::string& pre,
                       const std::string& post,
                       int width,
                       Justify just = JUSTIFY_LEFT,
                       uint32_t tick = 0);

// Window of `message` shown at `tick` when it does not fit in `width`
std::string rotateText(const std::string& message, int width, uint32_t tick);

#endif // LINE_FORMATTER_H
