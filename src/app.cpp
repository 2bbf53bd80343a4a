#include "app.hpp"
#include <ncurses.h>

App::App(TextDeck deck, Config cfg, ITerminal& term)
    : title_(std::move(deck.title)),
      cfg_(std::move(cfg)),
      term_(term),
      session_(std::move(deck.cards),
               [order = cfg_.order, seed = cfg_.seed](std::vector<TextCard> cards) {
                 return make_sequencer(order, std::move(cards), seed);
               }) {}

void App::run() {
  while (!should_quit_) {
    render();
    int ch = term_.read_key();
    handle_key(ch);
  }
}

void App::handle_key(int ch) {
  if (ch == KEY_RESIZE) return;
  auto a = cfg_.keys.lookup(ch);
  if (!a) return;
  dispatch(*a);
}

bool App::dispatch(Action a) {
  bool taken = false;
  switch (a) {
    case Action::Reveal:
      taken = session_.reveal();
      break;
    case Action::ScoreHit:
    case Action::ScoreMiss: {
      Score s = a == Action::ScoreHit ? Score::Hit : Score::Miss;
      taken = cfg_.autoadvance ? session_.answer(s) : session_.score(s);
      break;
    }
    case Action::Advance:
      taken = session_.advance();
      break;
    case Action::Restart:
      taken = session_.restart();
      break;
    case Action::Quit:
      taken = session_.quit();
      should_quit_ = true;
      break;
  }
  if (taken) message_.clear();
  return taken;
}

void App::render() {
  RenderOptions opts;
  if (cfg_.show_title && !title_.empty()) opts.title = title_;
  opts.autoadvance = cfg_.autoadvance;
  opts.keys = &cfg_.keys;
  opts.message = message_;
  renderer_.render(term_, session_, opts);
}
