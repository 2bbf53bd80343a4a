#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight enums/errors (Action, TerminalError).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <stdexcept>
#include <string>

enum class Action { Reveal, ScoreHit, ScoreMiss, Advance, Restart, Quit };

// Raised on any terminal read/write failure; fatal to the session.
class TerminalError : public std::runtime_error {
public:
  explicit TerminalError(const std::string& what) : std::runtime_error(what) {}
};
