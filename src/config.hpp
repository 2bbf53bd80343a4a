#pragma once
/*
 * Config
 *
 * Purpose: user options read from the rc file ($KADEU_RC, else ~/.kadeurc).
 * Format: one command per line, optional leading ':'; '#', '"' and '//' start comment lines.
 *   set order linear|shuffle    set seed <n>          set autoadvance on|off
 *   set color on|off            set title on|off      map <action> <key>
 */
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "input.hpp"
#include "sequencer.hpp"

struct Config {
  Order order = Order::Linear;
  std::uint32_t seed = 0; // 0: random
  bool autoadvance = true;
  bool color = true;
  bool show_title = true;
  Keymap keys;
};

void register_config_commands(CommandRegistry& registry, Config& cfg, std::string& message);
// Runs each line; the last message produced (error or confirmation) is left in message.
void apply_config_lines(Config& cfg, const std::vector<std::string>& lines, std::string& message);
std::optional<std::filesystem::path> rc_path();
void load_rc(Config& cfg, std::string& message);
