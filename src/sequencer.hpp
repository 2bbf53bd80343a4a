#pragma once
/*
 * Sequencer
 *
 * Purpose: single-use, exhaustible production of cards from an owned collection.
 * Strategies: linear (input order), shuffle (seeded permutation). Adding one needs no Session change.
 */
#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string_view>
#include <utility>
#include <vector>

enum class Order { Linear, Shuffle };

inline std::string_view order_name(Order o) {
  switch (o) {
    case Order::Linear: return "linear";
    case Order::Shuffle: return "shuffle";
  }
  return "linear";
}

inline std::optional<Order> order_from_name(std::string_view s) {
  if (s == "linear") return Order::Linear;
  if (s == "shuffle" || s == "random") return Order::Shuffle;
  return std::nullopt;
}

template <typename C>
class ISequencer {
public:
  virtual ~ISequencer() = default;
  // nullopt once every card has been produced
  virtual std::optional<C> next() = 0;
  virtual bool exhausted() const = 0;
  virtual int remaining() const = 0;
  virtual std::string_view name() const = 0;
};

template <typename C>
class LinearSequencer : public ISequencer<C> {
public:
  explicit LinearSequencer(std::vector<C> cards) : cards_(std::move(cards)) {}

  std::optional<C> next() override {
    if (pos_ >= cards_.size()) return std::nullopt;
    return std::move(cards_[pos_++]);
  }
  bool exhausted() const override { return pos_ >= cards_.size(); }
  int remaining() const override { return static_cast<int>(cards_.size() - pos_); }
  std::string_view name() const override { return order_name(Order::Linear); }

private:
  std::vector<C> cards_;
  size_t pos_ = 0;
};

template <typename C>
class ShuffleSequencer : public ISequencer<C> {
public:
  // seed 0 draws from std::random_device
  ShuffleSequencer(std::vector<C> cards, std::uint32_t seed) : cards_(std::move(cards)) {
    if (seed == 0) seed = std::random_device{}();
    std::mt19937 rng(seed);
    std::shuffle(cards_.begin(), cards_.end(), rng);
  }

  std::optional<C> next() override {
    if (pos_ >= cards_.size()) return std::nullopt;
    return std::move(cards_[pos_++]);
  }
  bool exhausted() const override { return pos_ >= cards_.size(); }
  int remaining() const override { return static_cast<int>(cards_.size() - pos_); }
  std::string_view name() const override { return order_name(Order::Shuffle); }

private:
  std::vector<C> cards_;
  size_t pos_ = 0;
};

template <typename C>
std::unique_ptr<ISequencer<C>> make_sequencer(Order order, std::vector<C> cards, std::uint32_t seed = 0) {
  switch (order) {
    case Order::Shuffle: return std::make_unique<ShuffleSequencer<C>>(std::move(cards), seed);
    case Order::Linear: break;
  }
  return std::make_unique<LinearSequencer<C>>(std::move(cards));
}
