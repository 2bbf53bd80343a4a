#include "renderer.hpp"
#include "card_view.hpp"
#include "widget.hpp"
#include <algorithm>
#include <sstream>

static std::string hint(const Keymap* keys, Action a) {
  std::string k = keys ? keys->key_label(a) : std::string("?");
  return k + " " + std::string(action_name(a));
}

static std::string hints_for(const Session<TextCard>& s, const RenderOptions& opts) {
  std::ostringstream oss;
  if (s.state() == SessionState::Finished) {
    if (s.can_restart()) oss << hint(opts.keys, Action::Restart) << "  ";
    oss << hint(opts.keys, Action::Quit);
    return oss.str();
  }
  const Progress<TextCard>* p = s.current_progress();
  if (!s.revealed()) {
    oss << hint(opts.keys, Action::Reveal);
  } else if (p && p->has_score()) {
    oss << hint(opts.keys, Action::Advance);
  } else {
    oss << hint(opts.keys, Action::ScoreHit) << "  " << hint(opts.keys, Action::ScoreMiss);
    if (!opts.autoadvance) oss << "  " << hint(opts.keys, Action::Advance);
  }
  oss << "  " << hint(opts.keys, Action::Quit);
  return oss.str();
}

void Renderer::render(ITerminal& term, const Session<TextCard>& session, const RenderOptions& opts) {
  TermSize sz = term.getSize();
  term.clear();
  if (session.state() != SessionState::Quit && sz.rows > 0 && sz.cols > 0) {
    Rect body{0, 0, sz.rows - 1, sz.cols};
    Rect footer{sz.rows - 1, 0, 1, sz.cols};
    if (session.state() == SessionState::Finished) render_summary(term, body, session, opts);
    else render_card(term, body, session, opts);
    render_footer(term, footer, session, opts);
  }
  term.move_cursor(std::max(0, sz.rows - 1), 0);
  term.refresh();
}

void Renderer::render_card(ITerminal& term, const Rect& body, const Session<TextCard>& session, const RenderOptions& opts) {
  const TextCard* card = session.current();
  if (!card) return;
  CardSide view(*card, session.revealed(), opts.title);
  view.render(body, term);
}

void Renderer::render_summary(ITerminal& term, const Rect& body, const Session<TextCard>& session, const RenderOptions& opts) {
  Tally t = session.summary();
  Container<IWidget> page(Axis::Vertical);
  TextOptions heading;
  heading.centered = true;
  std::string done = opts.title ? *opts.title + ": finished" : std::string("finished");
  done += " (" + std::to_string(t.total()) + " cards)";
  page.emplace<Text>(done, heading);

  auto& boxes = page.emplace<Container<Text>>(Axis::Horizontal);
  TextOptions hit;
  hit.centered = true;
  hit.bordered = true;
  hit.border_title = "Hit";
  hit.color = kPairHit;
  TextOptions miss = hit;
  miss.border_title = "Miss";
  miss.color = kPairMiss;
  boxes.emplace(std::to_string(t.hits), hit);
  boxes.emplace(std::to_string(t.misses), miss);
  page.render(body, term);
}

void Renderer::render_footer(ITerminal& term, const Rect& footer, const Session<TextCard>& session, const RenderOptions& opts) {
  Container<Text> bar(Axis::Horizontal);
  Tally t = session.summary();
  std::string where = session.state() == SessionState::Finished
      ? std::string("done")
      : "card " + std::to_string(session.position()) + "/" + std::to_string(session.total());
  bar.emplace(where);
  bar.emplace(std::string(score_name(Score::Hit)) + " " + std::to_string(t.hits) + "  " +
              std::string(score_name(Score::Miss)) + " " + std::to_string(t.misses));
  bar.emplace(opts.message.empty() ? hints_for(session, opts) : opts.message);
  bar.render(footer, term);
}
