#include "config.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static void applies_commands() {
  Config cfg;
  std::string msg;
  apply_config_lines(cfg, {
    "# comment",
    "\" vim style comment",
    "// slash comment",
    "",
    "  set order shuffle  ",
    ":set seed=1234",
    "set autoadvance off",
    "set color 0",
    "set title",
    "map reveal x",
    "unmap f",
  }, msg);
  assert(cfg.order == Order::Shuffle);
  assert(cfg.seed == 1234);
  assert(!cfg.autoadvance);
  assert(!cfg.color);
  assert(!cfg.show_title); // bare switch toggles
  assert(cfg.keys.lookup('x') == Action::Reveal);
  assert(!cfg.keys.lookup('f').has_value());
  assert(cfg.keys.lookup(' ') == Action::Reveal);
  assert(msg == "unmapped f");
}

static void bad_values_leave_defaults() {
  Config cfg;
  std::string msg;
  apply_config_lines(cfg, {"set order diagonal"}, msg);
  assert(cfg.order == Order::Linear);
  assert(msg.find("unknown order") != std::string::npos);
  apply_config_lines(cfg, {"set seed abc"}, msg);
  assert(cfg.seed == 0);
  apply_config_lines(cfg, {"set autoadvance maybe"}, msg);
  assert(cfg.autoadvance);
  apply_config_lines(cfg, {"map fly x"}, msg);
  assert(!cfg.keys.lookup('x').has_value());
  apply_config_lines(cfg, {"frobnicate"}, msg);
  assert(msg == "unknown command: frobnicate");
  apply_config_lines(cfg, {"set volume 3"}, msg);
  assert(msg == "unknown command: set volume");
}

static void reads_rc_file() {
  auto p = std::filesystem::temp_directory_path() / ("kadeurc." + std::to_string(::getpid()));
  std::ofstream(p) << "set order shuffle\r\nset seed 9\n";
  setenv("KADEU_RC", p.c_str(), 1);
  assert(rc_path() == p);
  Config cfg;
  std::string msg;
  load_rc(cfg, msg);
  assert(cfg.order == Order::Shuffle);
  assert(cfg.seed == 9);
  std::filesystem::remove(p);

  Config untouched;
  std::string none;
  load_rc(untouched, none); // missing rc is not an error
  assert(none.empty());
  assert(untouched.order == Order::Linear);
  unsetenv("KADEU_RC");
}

static void key_names() {
  assert(key_from_name("space") == ' ');
  assert(key_from_name("q") == 'q');
  assert(!key_from_name("hyper").has_value());
  assert(key_name(' ') == "space");
  assert(key_name('n') == "n");
  Keymap km;
  assert(km.lookup('q') == Action::Quit);
  assert(km.lookup('h') == Action::ScoreHit);
  assert(km.lookup('m') == Action::ScoreMiss);
  assert(km.lookup('\n') == Action::Advance);
  assert(km.lookup('r') == Action::Restart);
  assert(km.key_label(Action::Quit) == "q");
  assert(action_from_name("next") == Action::Advance);
}

int main() {
  applies_commands();
  bad_values_leave_defaults();
  reads_rc_file();
  key_names();
  return 0;
}
