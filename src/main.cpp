#include "app.hpp"
#include "config.hpp"
#include "deck_loader.hpp"
#include "ncurses_terminal.hpp"
#include "terminal.hpp"
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>

static void usage(const char* argv0) {
  std::cout << "usage: " << argv0 << " [deck.json]\n"
            << "  deck.json: {\"title\": ..., \"cards\": [{\"front\": ..., \"back\": ...}]}\n"
            << "  without a deck the built-in sample deck is used\n";
}

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  if (argc >= 2) {
    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) { usage(argv[0]); return 0; }
    path = std::filesystem::path(argv[1]);
  }
  TextDeck deck = default_deck();
  std::string msg;
  if (path && !load_deck(*path, deck, msg)) {
    std::cerr << "kadeu: " << msg << "\n";
    return 1;
  }
  Config cfg;
  std::string rc_msg;
  load_rc(cfg, rc_msg);
  return run_guarded<Terminal>([&] {
    NcursesTerminal term(cfg.color);
    App app(std::move(deck), std::move(cfg), term);
    app.set_message(rc_msg);
    app.run();
  }, std::cerr);
}
