#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, frame, key input, refresh).
 * Goal: decouple widgets from concrete impls (ncurses/headless), enable testing.
 */
#include <string>
#include "layout.hpp"

struct TermSize { int rows; int cols; };

enum ColorPair { kPairTitle = 1, kPairDefault = 2, kPairHit = 3, kPairMiss = 4 };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  // box around the whole area, title on the top edge
  virtual void draw_frame(const Rect& area, const std::string& title) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  // blocking; throws TerminalError on failure
  virtual int read_key() = 0;
};
