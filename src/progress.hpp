#pragma once
/*
 * Progress
 *
 * Purpose: a card paired with its outcome for the current session.
 * Rule: the score goes unset -> Hit|Miss exactly once; Session enforces it, Progress does not.
 */
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

enum class Score { Hit, Miss };

inline std::string_view score_name(Score s) {
  switch (s) {
    case Score::Hit: return "hit";
    case Score::Miss: return "miss";
  }
  return "miss";
}

template <typename T>
class Progress {
public:
  explicit Progress(T item) : item_(std::move(item)) {}

  const T& item() const { return item_; }
  bool has_score() const { return score_.has_value(); }
  const Score* score() const { return score_ ? &*score_ : nullptr; }
  void record(Score s) { score_ = s; }

private:
  T item_;
  std::optional<Score> score_;
};

struct Tally {
  int hits = 0;
  int misses = 0;
  int total() const { return hits + misses; }
  bool operator==(const Tally&) const = default;
};

template <typename T>
Tally tally(const std::vector<Progress<T>>& history) {
  Tally t;
  for (const auto& p : history) {
    const Score* s = p.score();
    if (!s) continue;
    if (*s == Score::Hit) t.hits++;
    else t.misses++;
  }
  return t;
}
