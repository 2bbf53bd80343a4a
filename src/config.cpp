#include "config.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

static std::optional<bool> parse_switch(const std::string& v) {
  if (v == "on" || v == "1" || v == "true") return true;
  if (v == "off" || v == "0" || v == "false") return false;
  return std::nullopt;
}

static void register_switch(CommandRegistry& registry, const std::string& name, bool& field, std::string& message) {
  registry.register_command("set " + name, [&field, &message, name](const std::vector<std::string>& args){
    if (args.empty()) {
      field = !field;
      message = name + (field ? " on" : " off");
      return;
    }
    auto v = parse_switch(args[0]);
    if (!v) { message = "set " + name + ": use :set " + name + " on|off"; return; }
    field = *v;
    message = name + (field ? " on" : " off");
  });
}

void register_config_commands(CommandRegistry& registry, Config& cfg, std::string& message) {
  registry.register_command("set order", [&cfg, &message](const std::vector<std::string>& args){
    if (args.empty()) { message = "set order: use :set order linear|shuffle"; return; }
    auto o = order_from_name(args[0]);
    if (!o) { message = "set order: unknown order " + args[0]; return; }
    cfg.order = *o;
    message = std::string("order=") + std::string(order_name(cfg.order));
  });
  registry.register_command("set seed", [&cfg, &message](const std::vector<std::string>& args){
    if (args.empty()) { message = "set seed: use :set seed <number>"; return; }
    const std::string& s = args[0];
    bool ok = !s.empty() && s.size() <= 9 && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { message = "set seed: seed must be a number below 10^9"; return; }
    cfg.seed = static_cast<std::uint32_t>(std::stoul(s));
    message = "seed=" + s;
  });
  register_switch(registry, "autoadvance", cfg.autoadvance, message);
  register_switch(registry, "color", cfg.color, message);
  register_switch(registry, "title", cfg.show_title, message);
  registry.register_command("map", [&cfg, &message](const std::vector<std::string>& args){
    if (args.size() < 2) { message = "map: use :map <action> <key>"; return; }
    auto a = action_from_name(args[0]);
    if (!a) { message = "map: unknown action " + args[0]; return; }
    auto k = key_from_name(args[1]);
    if (!k) { message = "map: unknown key " + args[1]; return; }
    cfg.keys.bind(*k, *a);
    message = "mapped " + args[1] + " to " + std::string(action_name(*a));
  });
  registry.register_command("unmap", [&cfg, &message](const std::vector<std::string>& args){
    if (args.empty()) { message = "unmap: use :unmap <key>"; return; }
    auto k = key_from_name(args[0]);
    if (!k) { message = "unmap: unknown key " + args[0]; return; }
    cfg.keys.unbind(*k);
    message = "unmapped " + args[0];
  });
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

void apply_config_lines(Config& cfg, const std::vector<std::string>& lines, std::string& message) {
  CommandRegistry registry;
  register_config_commands(registry, cfg, message);
  for (const auto& raw : lines) {
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    registry.execute_line(s, message);
  }
}

std::optional<std::filesystem::path> rc_path() {
  if (const char* env = std::getenv("KADEU_RC"); env && *env) return std::filesystem::path(env);
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / ".kadeurc";
}

void load_rc(Config& cfg, std::string& message) {
  auto p = rc_path();
  if (!p) return;
  std::error_code ec;
  if (!std::filesystem::exists(*p, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(*p, lines, msg)) { message = msg; return; }
  apply_config_lines(cfg, lines, message);
}
