#include "cmd_registry.hpp"
#include <sstream>

bool CommandRegistry::execute_line(const std::string& line, std::string& message) const {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return false;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::string value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }
    std::string composite = "set " + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!execute(composite, subargs)) { message = "unknown command: " + composite; return false; }
    return true;
  }
  if (!execute(cmd, args)) { message = "unknown command: " + cmd; return false; }
  return true;
}
