#include "deck_loader.hpp"
#include "file_reader.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static bool read_string_field(const json& obj, const char* key, std::string& out, std::string& msg,
                              const std::string& where) {
  auto it = obj.find(key);
  if (it == obj.end()) { msg = where + ": missing \"" + key + "\""; return false; }
  if (!it->is_string()) { msg = where + ": \"" + key + "\" must be a string"; return false; }
  out = it->get<std::string>();
  return true;
}

bool parse_deck(const std::string& text, TextDeck& out, std::string& msg) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded()) { msg = "deck is not valid JSON"; return false; }
  if (!doc.is_object()) { msg = "deck must be a JSON object"; return false; }
  TextDeck deck;
  if (!read_string_field(doc, "title", deck.title, msg, "deck")) return false;
  auto cards = doc.find("cards");
  if (cards == doc.end()) { msg = "deck: missing \"cards\""; return false; }
  if (!cards->is_array()) { msg = "deck: \"cards\" must be an array"; return false; }
  deck.cards.reserve(cards->size());
  for (size_t i = 0; i < cards->size(); ++i) {
    const json& c = (*cards)[i];
    std::string where = "card " + std::to_string(i + 1);
    if (!c.is_object()) { msg = where + ": must be an object"; return false; }
    std::string front, back;
    if (!read_string_field(c, "front", front, msg, where)) return false;
    if (!read_string_field(c, "back", back, msg, where)) return false;
    deck.cards.emplace_back(std::move(front), std::move(back));
  }
  out = std::move(deck);
  msg = "loaded " + std::to_string(out.size()) + " cards";
  return true;
}

bool load_deck(const std::filesystem::path& path, TextDeck& out, std::string& msg) {
  std::string text;
  if (!mmap_read_file(path, text, msg)) return false;
  if (!parse_deck(text, out, msg)) { msg = path.string() + ": " + msg; return false; }
  return true;
}

TextDeck default_deck() {
  TextDeck d;
  d.title = "Foobar Deck";
  d.cards.emplace_back("Foo", "Bar");
  d.cards.emplace_back("Bizz", "bazz");
  return d;
}
