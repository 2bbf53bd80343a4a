#include "progress.hpp"
#include "flashcard.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  Progress<TextCard> p(TextCard("Foo", "Bar"));
  assert(!p.has_score());
  assert(p.score() == nullptr);
  assert(p.item().front() == "Foo");
  assert(p.item().display_back() == "Bar");
  p.record(Score::Hit);
  assert(p.has_score());
  assert(p.score() && *p.score() == Score::Hit);
  assert(p.has_score());

  assert(score_name(Score::Hit) == "hit");
  assert(score_name(Score::Miss) == "miss");

  std::vector<Progress<TextCard>> history;
  history.emplace_back(TextCard("a", "1"));
  history.emplace_back(TextCard("b", "2"));
  history.emplace_back(TextCard("c", "3"));
  history[0].record(Score::Hit);
  history[1].record(Score::Miss);
  history[2].record(Score::Hit);
  Tally t = tally(history);
  assert(t.hits == 2);
  assert(t.misses == 1);
  assert(t.total() == 3);

  // unscored entries are not counted
  history.emplace_back(TextCard("d", "4"));
  assert(tally(history) == t);

  Card<int, double> numeric(3, 0.5);
  static_assert(Flashcard<Card<int, double>>);
  assert(numeric.display_front() == "3");
  assert(numeric.display_back() == "0.5");
  return 0;
}
