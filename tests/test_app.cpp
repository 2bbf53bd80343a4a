#include "app.hpp"
#include "deck_loader.hpp"
#include "headless_terminal.hpp"
#include "types.hpp"
#include <cassert>
#include <new>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <string>

static void study_foobar_deck() {
  HeadlessTerminal term(10, 40);
  App app(default_deck(), Config{}, term);
  app.render();
  assert(term.row_text(0).find("Foobar Deck") == 1);
  assert(term.row_text(4).find("Foo") != std::string::npos);
  assert(term.row_text(9).find("card 1/2") == 0);

  // scoring before reveal changes nothing
  app.handle_key('h');
  app.render();
  assert(app.session().side() == Side::Front);
  assert(app.session().history().empty());
  assert(term.row_text(4).find("Foo") != std::string::npos);

  app.handle_key(' ');
  app.render();
  assert(term.row_text(4).find("Bar") != std::string::npos);

  app.handle_key('h');
  app.render();
  assert(app.session().side() == Side::Front);
  assert(term.row_text(4).find("Bizz") != std::string::npos);
  assert(term.contains("card 2/2"));
  assert(term.contains("hit 1  miss 0"));

  app.handle_key(' ');
  app.handle_key('m');
  app.render();
  assert(app.session().state() == SessionState::Finished);
  assert(app.session().summary() == (Tally{1, 1}));
  assert(term.contains("finished"));
  assert(term.contains("+Hit"));
  assert(term.contains("+Miss"));
  assert(term.contains("r restart"));

  app.handle_key('r');
  assert(app.session().state() == SessionState::InProgress);
  assert(app.session().summary() == Tally{});
  app.handle_key('q');
  assert(app.should_quit());
  assert(app.session().state() == SessionState::Quit);
}

static void manual_advance() {
  HeadlessTerminal term(8, 30);
  Config cfg;
  cfg.autoadvance = false;
  App app(default_deck(), cfg, term);
  app.handle_key(' ');
  app.handle_key('m');
  assert(app.session().current_progress()->has_score());
  assert(app.session().current()->front() == "Foo");
  app.handle_key('h'); // second score is ignored
  assert(*app.session().current_progress()->score() == Score::Miss);
  app.render();
  assert(term.contains("n next"));
  app.handle_key('\n');
  assert(app.session().current()->front() == "Bizz");
}

static void run_loop_and_terminal_failure() {
  HeadlessTerminal term(6, 30);
  App app(default_deck(), Config{}, term);
  term.push_keys(" h h m q");
  app.run();
  assert(app.should_quit());
  // both cards scored hit; the session was finished before " m " arrived
  assert(app.session().state() == SessionState::Quit);
  assert(app.session().summary() == (Tally{2, 0}));
  assert(term.refresh_count() == 8);

  HeadlessTerminal dead(6, 30);
  App stuck(default_deck(), Config{}, dead);
  bool thrown = false;
  try {
    stuck.run();
  } catch (const TerminalError&) {
    thrown = true;
  }
  assert(thrown);
}

static void empty_deck_shows_summary() {
  HeadlessTerminal term(6, 30);
  TextDeck d;
  d.title = "Empty";
  App app(std::move(d), Config{}, term);
  app.render();
  assert(app.session().state() == SessionState::Finished);
  assert(term.contains("Empty: finished (0 cards)"));
}

static int guards_alive = 0;
static int guards_released = 0;

struct RecordingGuard {
  RecordingGuard() { guards_alive++; }
  ~RecordingGuard() { guards_alive--; guards_released++; }
};

static void guard_released_on_every_exit() {
  std::ostringstream err;
  int rc = run_guarded<RecordingGuard>([] {
    assert(guards_alive == 1);
    throw std::system_error(std::make_error_code(std::errc::no_such_device), "random_device");
  }, err);
  assert(rc == 1);
  assert(guards_alive == 0 && guards_released == 1);
  assert(err.str().find("kadeu: random_device") == 0);

  err.str("");
  rc = run_guarded<RecordingGuard>([] { throw TerminalError("failed to read from terminal"); }, err);
  assert(rc == 1);
  assert(guards_released == 2);
  assert(err.str() == "kadeu: failed to read from terminal\n");

  err.str("");
  rc = run_guarded<RecordingGuard>([] { throw std::bad_alloc(); }, err);
  assert(rc == 1);
  assert(guards_released == 3);

  err.str("");
  rc = run_guarded<RecordingGuard>([] {
    HeadlessTerminal term(6, 30);
    App app(default_deck(), Config{}, term);
    term.push_keys("q");
    app.run();
  }, err);
  assert(rc == 0);
  assert(err.str().empty());
  assert(guards_alive == 0 && guards_released == 4);
}

int main() {
  study_foobar_deck();
  manual_advance();
  run_loop_and_terminal_failure();
  empty_deck_shows_summary();
  guard_released_on_every_exit();
  return 0;
}
