/*
 * SysMenu, two-line status and control menu for single-board computers
 * Created by Ashley Cox at The Blind Man’s Workshop
 * https://theblindmansworkshop.com
 * No part of this code may be used or reproduced for commercial purposes without written permission and contractual agreement
 * All external libraries and frameworks are the property of their respective authors and governed by their respective licenses
 */

#include "navigator.h"

Navigator::Navigator(const MenuTree& tree) : _tree(tree), _observer(nullptr) {}

void Navigator::push(MenuId id) {
    if (!_tree.getItem(id)) return;
    _stack.push_back(id);
    display();
}

void Navigator::swap(MenuId id) {
    if (!_tree.getItem(id)) return;
    if (_stack.empty()) {
        _stack.push_back(id);
    } else {
        _stack.back() = id;
    }
    display();
}

MenuId Navigator::pop() {
    if (_stack.empty()) return MENU_NONE;

    MenuId top = _stack.back();
    if (!isRootMenu()) {
        _stack.pop_back();
        display();
    } else {
        // The root stays; still counts as user activity
        touch();
    }
    return top;
}

MenuId Navigator::peek() const {
    if (_stack.empty()) return MENU_NONE;
    return _stack.back();
}

const MenuItem* Navigator::current() const {
    return _tree.getItem(peek());
}

void Navigator::display() {
    if (_observer) _observer->onDisplay(*this);
}

void Navigator::touch() {
    if (_observer) _observer->onTouch(*this);
}

void Navigator::doUp() {
    pop();
}

void Navigator::doPrev() {
    const MenuItem* item = current();
    if (item && item->getPrev() != MENU_NONE) swap(item->getPrev());
}

void Navigator::doNext() {
    const MenuItem* item = current();
    if (item && item->getNext() != MENU_NONE) swap(item->getNext());
}

void Navigator::doAction() {
    const MenuItem* item = current();
    if (item) item->invoke(*this);

    // The action may have changed what the item shows
    display();
}

std::string Navigator::describe() const {
    std::string path = "Menu: ";
    for (size_t i = 0; i < _stack.size(); i++) {
        const MenuItem* item = _tree.getItem(_stack[i]);
        if (!item) continue;
        if (i > 0) path += " > ";
        path += item->getTitle().getText(*this);
    }
    return path;
}
