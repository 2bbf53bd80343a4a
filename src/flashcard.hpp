#pragma once
/*
 * Flashcard
 *
 * Purpose: capability every card representation must offer to the engine and renderer
 * (typed front/back access plus string display forms).
 * Note: Card<Front, Back> is the stock representation; display goes through to_display().
 */
#include <concepts>
#include <sstream>
#include <string>
#include <utility>

template <typename C>
concept Flashcard = requires(const C& c) {
  typename C::FrontType;
  typename C::BackType;
  { c.front() } -> std::convertible_to<const typename C::FrontType&>;
  { c.back() } -> std::convertible_to<const typename C::BackType&>;
  { c.display_front() } -> std::convertible_to<std::string>;
  { c.display_back() } -> std::convertible_to<std::string>;
};

inline std::string to_display(const std::string& s) { return s; }

template <typename T>
std::string to_display(const T& v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

template <typename Front, typename Back>
class Card {
public:
  using FrontType = Front;
  using BackType = Back;

  Card(Front front, Back back) : front_(std::move(front)), back_(std::move(back)) {}

  const Front& front() const { return front_; }
  const Back& back() const { return back_; }
  std::string display_front() const { return to_display(front_); }
  std::string display_back() const { return to_display(back_); }

  bool operator==(const Card&) const = default;

private:
  Front front_;
  Back back_;
};

using TextCard = Card<std::string, std::string>;
static_assert(Flashcard<TextCard>, "TextCard must satisfy the Flashcard capability");
