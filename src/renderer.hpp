#pragma once
/*
 * Renderer
 *
 * Purpose: build the frame's widget tree from session state and paint it through ITerminal.
 * Layout: card view over a one-row footer (progress | tally | hints); a Hit/Miss summary when finished.
 * Constraint: stateless; the tree is rebuilt on every call.
 */
#include <optional>
#include <string>
#include "deck.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "session.hpp"

struct RenderOptions {
  std::optional<std::string> title;
  bool autoadvance = true;
  const Keymap* keys = nullptr;
  std::string message;
};

class Renderer {
public:
  void render(ITerminal& term, const Session<TextCard>& session, const RenderOptions& opts);
private:
  void render_card(ITerminal& term, const Rect& body, const Session<TextCard>& session, const RenderOptions& opts);
  void render_summary(ITerminal& term, const Rect& body, const Session<TextCard>& session, const RenderOptions& opts);
  void render_footer(ITerminal& term, const Rect& footer, const Session<TextCard>& session, const RenderOptions& opts);
};
