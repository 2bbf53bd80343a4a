#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal that records drawing into a character grid and replays scripted keys.
 * Usage: tests render widgets/screens, then assert on row_text()/cell(); frames use + - |.
 * Note: read_key() past the end of the script throws TerminalError.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void draw_frame(const Rect& area, const std::string& title) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  int read_key() override;

  void push_key(int ch) { keys_.push_back(ch); }
  void push_keys(const std::string& keys);

  std::string row_text(int row) const;
  const std::string& cell(int row, int col) const;
  int color_at(int row, int col) const;
  bool contains(const std::string& needle) const;
  int refresh_count() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text, int color);
  int rows_;
  int cols_;
  std::vector<std::vector<std::string>> cells_;
  std::vector<std::vector<int>> colors_;
  std::deque<int> keys_;
  int refreshes_ = 0;
};
