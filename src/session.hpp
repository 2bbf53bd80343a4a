#pragma once
/*
 * Session
 *
 * Purpose: reveal/score/advance state machine for one study run over a deck.
 * Rules: scoring only while the back is shown, once per card; advance only after a score;
 *        restart only from Finished and only when the deck was retained.
 * Note: every operation returns false and leaves state untouched when the transition is illegal.
 */
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include "flashcard.hpp"
#include "progress.hpp"
#include "sequencer.hpp"

enum class Side { Front, Back };
enum class SessionState { InProgress, Finished, Quit };

template <Flashcard C>
class Session {
public:
  using SequencerFactory = std::function<std::unique_ptr<ISequencer<C>>(std::vector<C>)>;

  // Single-use session; restart() is unavailable.
  explicit Session(std::unique_ptr<ISequencer<C>> seq) : seq_(std::move(seq)) {
    total_ = seq_ ? seq_->remaining() : 0;
    pull_next();
  }

  // Retains the cards so the session can be restarted with a fresh sequencer.
  Session(std::vector<C> cards, SequencerFactory factory)
      : retained_(std::move(cards)), factory_(std::move(factory)) {
    begin();
  }

  SessionState state() const { return state_; }
  Side side() const { return side_; }
  bool revealed() const { return side_ == Side::Back; }
  bool can_restart() const { return retained_.has_value() && factory_ != nullptr; }

  const C* current() const { return current_ ? &current_->item() : nullptr; }
  const Progress<C>* current_progress() const { return current_ ? &*current_ : nullptr; }
  const std::vector<Progress<C>>& history() const { return history_; }
  Tally summary() const { return tally(history_); }
  // 1-based index of the current card
  int position() const { return static_cast<int>(history_.size()) + (current_ ? 1 : 0); }
  int total() const { return total_; }

  bool reveal() {
    if (state_ != SessionState::InProgress || !current_) return false;
    side_ = Side::Back;
    return true;
  }

  bool score(Score s) {
    if (state_ != SessionState::InProgress || !current_) return false;
    if (side_ != Side::Back) return false;
    if (current_->has_score()) return false;
    current_->record(s);
    return true;
  }

  bool advance() {
    if (state_ != SessionState::InProgress || !current_) return false;
    if (!current_->has_score()) return false;
    history_.push_back(std::move(*current_));
    current_.reset();
    pull_next();
    return true;
  }

  bool answer(Score s) { return score(s) && advance(); }

  bool restart() {
    if (state_ != SessionState::Finished || !can_restart()) return false;
    begin();
    return true;
  }

  // Drops the in-flight card without recording an outcome.
  bool quit() {
    if (state_ == SessionState::Quit) return false;
    current_.reset();
    side_ = Side::Front;
    state_ = SessionState::Quit;
    return true;
  }

private:
  void begin() {
    history_.clear();
    current_.reset();
    state_ = SessionState::InProgress;
    seq_ = factory_(*retained_);
    total_ = seq_ ? seq_->remaining() : 0;
    pull_next();
  }

  void pull_next() {
    side_ = Side::Front;
    std::optional<C> c = seq_ ? seq_->next() : std::nullopt;
    if (!c) {
      state_ = SessionState::Finished;
      return;
    }
    current_.emplace(std::move(*c));
  }

  std::unique_ptr<ISequencer<C>> seq_;
  std::optional<std::vector<C>> retained_;
  SequencerFactory factory_;
  std::optional<Progress<C>> current_;
  std::vector<Progress<C>> history_;
  Side side_ = Side::Front;
  SessionState state_ = SessionState::InProgress;
  int total_ = 0;
};
