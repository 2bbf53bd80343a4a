#include "deck_loader.hpp"
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::filesystem::path write_temp(const std::string& name, const std::string& body) {
  auto p = std::filesystem::temp_directory_path() / (name + "." + std::to_string(::getpid()) + ".json");
  std::ofstream(p) << body;
  return p;
}

static void parses_document() {
  TextDeck d;
  std::string msg;
  bool ok = parse_deck(R"({"title": "Capitals", "cards": [
      {"front": "France", "back": "Paris"},
      {"front": "Japan", "back": "Tokyo"},
      {"front": "Peru", "back": "Lima"}]})", d, msg);
  assert(ok);
  assert(d.title == "Capitals");
  assert(d.size() == 3);
  assert(d.cards[0].front() == "France");
  assert(d.cards[2].back() == "Lima");
}

static void empty_card_list_is_valid() {
  TextDeck d;
  std::string msg;
  assert(parse_deck(R"({"title": "Nothing", "cards": []})", d, msg));
  assert(d.empty());
}

static void rejects_bad_documents() {
  const char* bad[] = {
    "not json",
    "[1, 2]",
    R"({"cards": []})",
    R"({"title": 4, "cards": []})",
    R"({"title": "x"})",
    R"({"title": "x", "cards": {}})",
    R"({"title": "x", "cards": [7]})",
    R"({"title": "x", "cards": [{"front": "a"}]})",
    R"({"title": "x", "cards": [{"front": "a", "back": 2}]})",
  };
  for (const char* doc : bad) {
    TextDeck d = default_deck();
    std::string msg;
    assert(!parse_deck(doc, d, msg));
    assert(!msg.empty());
    assert(d.title == "Foobar Deck"); // untouched on failure
  }
  TextDeck d;
  std::string msg;
  assert(!parse_deck(R"({"title": "x", "cards": [{"front": "a", "back": "b"}, {"back": "c"}]})", d, msg));
  assert(msg.find("card 2") != std::string::npos);
}

static void loads_from_file() {
  auto p = write_temp("kadeu_deck", "{\r\n\"title\": \"File\",\r\n\"cards\": [{\"front\": \"1\", \"back\": \"one\"}]\r\n}\r\n");
  TextDeck d;
  std::string msg;
  assert(load_deck(p, d, msg));
  assert(d.title == "File" && d.size() == 1);
  std::filesystem::remove(p);

  assert(!load_deck(p, d, msg));
  assert(msg.find("can not open file") != std::string::npos);
}

static void default_deck_contents() {
  TextDeck d = default_deck();
  assert(d.title == "Foobar Deck");
  assert(d.size() == 2);
  assert(d.cards[0] == TextCard("Foo", "Bar"));
  assert(d.cards[1] == TextCard("Bizz", "bazz"));
}

int main() {
  parses_document();
  empty_card_list_is_valid();
  rejects_bad_documents();
  loads_from_file();
  default_deck_contents();
  return 0;
}
