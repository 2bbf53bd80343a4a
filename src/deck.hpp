#pragma once
/*
 * Deck
 *
 * Purpose: titled, ordered card collection handed to a session.
 * Loading: JSON documents {"title", "cards": [{"front", "back"}]} via deck_loader.
 */
#include <string>
#include <vector>
#include "flashcard.hpp"

template <Flashcard C>
struct Deck {
  std::string title;
  std::vector<C> cards;

  bool empty() const { return cards.empty(); }
  int size() const { return static_cast<int>(cards.size()); }
};

using TextDeck = Deck<TextCard>;
