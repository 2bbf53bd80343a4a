#pragma once
/*
 * Keymap
 *
 * Purpose: translate raw key codes into session Actions.
 * Extend: bindings are rebindable from the rc file ("map <action> <key>").
 */
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include "types.hpp"

class Keymap {
public:
  Keymap(); // default bindings
  std::optional<Action> lookup(int ch) const;
  void bind(int ch, Action a) { keys_[ch] = a; }
  void unbind(int ch) { keys_.erase(ch); }
  // first key bound to the action, for hints
  std::string key_label(Action a) const;
private:
  std::unordered_map<int, Action> keys_;
};

std::string_view action_name(Action a);
std::optional<Action> action_from_name(std::string_view s);
// "x", "space", "enter", "esc", "tab", "right", "left"
std::optional<int> key_from_name(const std::string& s);
std::string key_name(int ch);
