#pragma once
/*
 * App
 *
 * Purpose: study loop; one key → at most one session transition → one render.
 * Errors: illegal transitions are ignored silently; TerminalError from the terminal propagates.
 */
#include <exception>
#include <ostream>
#include <string>
#include "config.hpp"
#include "deck.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "session.hpp"
#include "types.hpp"

class App {
public:
  App(TextDeck deck, Config cfg, ITerminal& term);
  void run();
  void handle_key(int ch);
  bool dispatch(Action a);
  void render();

  const Session<TextCard>& session() const { return session_; }
  void set_message(std::string m) { message_ = std::move(m); }
  bool should_quit() const { return should_quit_; }

private:
  std::string title_;
  Config cfg_;
  ITerminal& term_;
  Session<TextCard> session_;
  Renderer renderer_;
  std::string message_;
  bool should_quit_ = false;
};

// Runs body while a Guard (terminal mode) is held. The guard is released before any error is
// reported, whatever the exception type. Returns the process exit code.
template <typename Guard, typename Body>
int run_guarded(Body&& body, std::ostream& err) {
  try {
    Guard guard;
    body();
  } catch (const std::exception& e) { // TerminalError included
    err << "kadeu: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
