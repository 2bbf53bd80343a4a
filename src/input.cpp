#include "input.hpp"
#include <ncurses.h>
#include <climits>

static constexpr int ESC = 27;
static constexpr int CTRL_c = 'C' - 64;

Keymap::Keymap() {
  bind(' ', Action::Reveal);
  bind('f', Action::Reveal);
  bind('h', Action::ScoreHit);
  bind('1', Action::ScoreHit);
  bind('m', Action::ScoreMiss);
  bind('2', Action::ScoreMiss);
  bind('\n', Action::Advance);
  bind('\r', Action::Advance);
  bind(KEY_ENTER, Action::Advance);
  bind(KEY_RIGHT, Action::Advance);
  bind('n', Action::Advance);
  bind('r', Action::Restart);
  bind('q', Action::Quit);
  bind(ESC, Action::Quit);
  bind(CTRL_c, Action::Quit);
}

std::optional<Action> Keymap::lookup(int ch) const {
  auto it = keys_.find(ch);
  if (it == keys_.end()) return std::nullopt;
  return it->second;
}

std::string Keymap::key_label(Action a) const {
  // prefer printable keys, then the lowest code, so hints are stable
  int best = INT_MAX;
  bool best_printable = false;
  for (const auto& [k, v] : keys_) {
    if (v != a) continue;
    bool printable = k > ' ' && k < 127;
    if ((printable && !best_printable) || (printable == best_printable && k < best)) {
      best = k;
      best_printable = printable;
    }
  }
  return best == INT_MAX ? std::string("?") : key_name(best);
}

std::string_view action_name(Action a) {
  switch (a) {
    case Action::Reveal: return "reveal";
    case Action::ScoreHit: return "hit";
    case Action::ScoreMiss: return "miss";
    case Action::Advance: return "next";
    case Action::Restart: return "restart";
    case Action::Quit: return "quit";
  }
  return "quit";
}

std::optional<Action> action_from_name(std::string_view s) {
  for (Action a : {Action::Reveal, Action::ScoreHit, Action::ScoreMiss, Action::Advance, Action::Restart, Action::Quit}) {
    if (action_name(a) == s) return a;
  }
  return std::nullopt;
}

std::optional<int> key_from_name(const std::string& s) {
  if (s.size() == 1) return static_cast<unsigned char>(s[0]);
  if (s == "space") return ' ';
  if (s == "enter") return '\n';
  if (s == "esc") return ESC;
  if (s == "tab") return '\t';
  if (s == "right") return KEY_RIGHT;
  if (s == "left") return KEY_LEFT;
  return std::nullopt;
}

std::string key_name(int ch) {
  switch (ch) {
    case ' ': return "space";
    case '\n': case '\r': case KEY_ENTER: return "enter";
    case ESC: return "esc";
    case '\t': return "tab";
    case KEY_RIGHT: return "right";
    case KEY_LEFT: return "left";
    default: break;
  }
  if (ch > ' ' && ch < 127) return std::string(1, static_cast<char>(ch));
  return "#" + std::to_string(ch);
}
