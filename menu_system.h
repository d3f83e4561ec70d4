/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#ifndef MENU_SYSTEM_H
#define MENU_SYSTEM_H

#include <stdint.h>
#include <functional>
#include <string>
#include <vector>
#include "config.h"

// Forward declaration
class Navigator;

typedef uint16_t MenuId;
static const MenuId MENU_NONE = 0xFFFF;

/**
 * @brief Source of a menu line.
 *
 * Either fixed text or a callback evaluated at draw time against a
 * read-only Navigator, so items can show live values (clock, IP, load).
 */
class TextProvider {
public:
    typedef std::function<std::string(const Navigator&)> TextCallback;

    TextProvider() {}
    TextProvider(const char* text) : _text(text ? text : "") {}
    TextProvider(const std::string& text) : _text(text) {}
    TextProvider(TextCallback callback) : _callback(callback) {}

    std::string getText(const Navigator& nav) const;
    bool isDynamic() const { return (bool)_callback; }

private:
    std::string _text;
    TextCallback _callback;
};

/**
 * @brief One node of the menu hierarchy.
 *
 * Siblings form a circular ring through prev/next ids. Items are created and
 * linked by MenuTree and are read-only afterwards.
 */
class MenuItem {
public:
    typedef std::function<void(Navigator&)> ActionCallback;

    MenuItem(MenuId id, const TextProvider& title, const TextProvider& description,
             ActionCallback action, float refreshRate);

    MenuId getId() const { return _id; }
    const TextProvider& getTitle() const { return _title; }
    const TextProvider& getDescription() const { return _description; }
    float getRefreshRate() const { return _refreshRate; }

    MenuId getPrev() const { return _prev; }
    MenuId getNext() const { return _next; }

    bool hasAction() const { return (bool)_action; }
    bool hasSiblings() const { return _next != MENU_NONE && _next != _id; }
    bool isLinked() const { return _next != MENU_NONE; }

    // No-op for inert items
    void invoke(Navigator& nav) const;

private:
    friend class MenuTree;

    MenuId _id;
    TextProvider _title;
    TextProvider _description;
    ActionCallback _action;
    float _refreshRate;
    MenuId _prev;
    MenuId _next;
};

/**
 * @brief Arena owning every MenuItem of a session.
 *
 * Items are addressed by MenuId (their index) so the sibling rings never
 * hold references into the container.
 */
class MenuTree {
public:
    MenuTree() {}

    // Returns MENU_NONE once the arena is full
    MenuId addItem(const TextProvider& title, const TextProvider& description,
                   MenuItem::ActionCallback action = nullptr,
                   float refreshRate = DEFAULT_REFRESH_RATE);

    /**
     * Links items into a ring in the given order. When parent is a valid
     * item, its action becomes "push the first item" and parent is
     * returned; otherwise the first item is returned.
     */
    MenuId link(MenuId parent, const std::vector<MenuId>& items);

    const MenuItem* getItem(MenuId id) const;
    size_t size() const { return _items.size(); }
    bool empty() const { return _items.empty(); }
    void clear() { _items.clear(); }

private:
    std::vector<MenuItem> _items;

    bool isValid(MenuId id) const { return id != MENU_NONE && id < _items.size(); }
};

#endif // MENU_SYSTEM_H
