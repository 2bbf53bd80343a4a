#pragma once
/*
 * DeckLoader
 *
 * Purpose: build a TextDeck from a JSON document {"title": ..., "cards": [{"front", "back"}]}.
 * Errors: return false with a user-visible message in msg; the deck is left untouched.
 */
#include <filesystem>
#include <string>
#include "deck.hpp"

bool parse_deck(const std::string& text, TextDeck& out, std::string& msg);
bool load_deck(const std::filesystem::path& path, TextDeck& out, std::string& msg);
TextDeck default_deck();
