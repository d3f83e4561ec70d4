/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef NAVIGATOR_H
#define NAVIGATOR_H

#include <string>
#include <vector>
#include "menu_system.h"

class Navigator;

/**
 * @brief Receives navigation notifications (implemented by UpdateScheduler).
 */
class NavigationObserver {
public:
    virtual ~NavigationObserver() {}

    // The visible item changed or a redisplay was requested
    virtual void onDisplay(const Navigator& nav) = 0;

    // User input that does not change what is shown
    virtual void onTouch(const Navigator& nav) = 0;
};

/**
 * @brief Menu navigation state machine.
 *
 * Holds the stack of visible items: bottom is the root, top is what the
 * display shows. The root is never popped. Every operation is total: a
 * missing link or action is a no-op.
 */
class Navigator {
public:
    explicit Navigator(const MenuTree& tree);

    void setObserver(NavigationObserver* observer) { _observer = observer; }
    const MenuTree& getTree() const { return _tree; }

    // --- Stack Operations ---
    void push(MenuId id);
    void swap(MenuId id);
    MenuId pop(); // Returns the item on top before the call
    MenuId peek() const;

    const MenuItem* current() const;
    bool isRootMenu() const { return _stack.size() == 1; }
    bool isEmpty() const { return _stack.empty(); }
    size_t depth() const { return _stack.size(); }

    // Asks the observer to redraw the current item
    void display();

    // Drops the whole stack without notifying (session teardown)
    void clear() { _stack.clear(); }

    // --- Input Handlers ---
    void doUp();
    void doPrev();
    void doNext();
    void doAction();

    // Path of titles, e.g. "Menu: System > Reboot"
    std::string describe() const;

private:
    const MenuTree& _tree;
    NavigationObserver* _observer;
    std::vector<MenuId> _stack;

    void touch();
};

#endif // NAVIGATOR_H
