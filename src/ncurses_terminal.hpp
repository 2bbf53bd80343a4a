#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and blocking key input.
 * Note: initialization/teardown is managed by the Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(bool enable_color = true);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void draw_frame(const Rect& area, const std::string& title) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  int read_key() override;
private:
  bool color_ = false;
};
