#pragma once
/*
 * CardSide
 *
 * Purpose: binds the current card, its flip state and the deck title into one widget.
 * Constraint: built fresh every frame from Session state; holds copies, never references into it.
 */
#include <optional>
#include <string>
#include <utility>
#include "flashcard.hpp"
#include "widget.hpp"

class CardSide : public IWidget {
public:
  template <Flashcard C>
  CardSide(const C& card, bool revealed, std::optional<std::string> title = std::nullopt)
      : front_(card.display_front()), back_(card.display_back()), revealed_(revealed), title_(std::move(title)) {}

  const std::string& content() const { return revealed_ ? back_ : front_; }
  bool revealed() const { return revealed_; }

  Text as_text() const {
    TextOptions opts;
    opts.centered = true;
    opts.bordered = true;
    opts.border_title = title_;
    return Text(content(), opts);
  }

  void render(const Rect& area, ITerminal& term) const override { as_text().render(area, term); }

private:
  std::string front_;
  std::string back_;
  bool revealed_;
  std::optional<std::string> title_;
};
