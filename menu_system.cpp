/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "menu_system.h"
#include "navigator.h"

// --- TextProvider ---
std::string TextProvider::getText(const Navigator& nav) const {
    if (_callback) return _callback(nav);
    return _text;
}

// --- MenuItem ---
MenuItem::MenuItem(MenuId id, const TextProvider& title, const TextProvider& description,
                   ActionCallback action, float refreshRate)
    : _id(id), _title(title), _description(description), _action(action),
      _refreshRate(refreshRate), _prev(MENU_NONE), _next(MENU_NONE) {}

void MenuItem::invoke(Navigator& nav) const {
    if (_action) _action(nav);
}

// --- MenuTree ---
MenuId MenuTree::addItem(const TextProvider& title, const TextProvider& description,
                         MenuItem::ActionCallback action, float refreshRate) {
    if (_items.size() >= MENU_NONE) return MENU_NONE;

    MenuId id = (MenuId)_items.size();
    _items.push_back(MenuItem(id, title, description, action, refreshRate));
    return id;
}

MenuId MenuTree::link(MenuId parent, const std::vector<MenuId>& items) {
    // Ignore ids that do not belong to this tree
    std::vector<MenuId> ring;
    for (MenuId id : items) {
        if (isValid(id)) ring.push_back(id);
    }

    if (ring.empty()) return isValid(parent) ? parent : MENU_NONE;

    const size_t n = ring.size();
    for (size_t i = 0; i < n; i++) {
        MenuItem& item = _items[ring[i]];
        item._next = ring[(i + 1) % n];
        item._prev = ring[(i + n - 1) % n];
    }

    if (!isValid(parent)) return ring[0];

    MenuId first = ring[0];
    _items[parent]._action = [first](Navigator& nav) { nav.push(first); };
    return parent;
}

const MenuItem* MenuTree::getItem(MenuId id) const {
    if (!isValid(id)) return nullptr;
    return &_items[id];
}
