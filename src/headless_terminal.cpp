#include "headless_terminal.hpp"
#include "types.hpp"
#include "text_width.hpp"

static const std::string kBlank = " ";

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { clear(); }

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  cells_.assign(rows_, std::vector<std::string>(cols_, kBlank));
  colors_.assign(rows_, std::vector<int>(cols_, 0));
}

void HeadlessTerminal::put(int row, int col, const std::string& text, int color) {
  if (row < 0 || row >= rows_) return;
  size_t i = 0;
  while (i < text.size()) {
    int w = 0;
    std::string g = next_glyph(text, i, w);
    if (w == 0) {
      // combining mark joins the previous cell
      if (col > 0 && col <= cols_) cells_[row][col - 1] += g;
      continue;
    }
    if (col >= 0 && col < cols_) {
      cells_[row][col] = g;
      colors_[row][col] = color;
    }
    // the trailing half of a wide glyph is an empty cell
    for (int k = 1; k < w; ++k) {
      if (col + k >= 0 && col + k < cols_) { cells_[row][col + k].clear(); colors_[row][col + k] = color; }
    }
    col += w;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, 0); }

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, color_pair_id);
}

void HeadlessTerminal::draw_frame(const Rect& area, const std::string& title) {
  if (area.width < 2 || area.height < 2) return;
  int top = area.row, left = area.col;
  int bottom = area.row + area.height - 1, right = area.col + area.width - 1;
  std::string edge(area.width - 2, '-');
  put(top, left + 1, edge, 0);
  put(bottom, left + 1, edge, 0);
  for (int r = top + 1; r < bottom; ++r) { put(r, left, "|", 0); put(r, right, "|", 0); }
  put(top, left, "+", 0);
  put(top, right, "+", 0);
  put(bottom, left, "+", 0);
  put(bottom, right, "+", 0);
  if (!title.empty()) put(top, left + 1, clip_to_width(title, area.width - 2), kPairTitle);
}

void HeadlessTerminal::move_cursor(int, int) {}

void HeadlessTerminal::refresh() { refreshes_++; }

int HeadlessTerminal::read_key() {
  if (keys_.empty()) throw TerminalError("headless: key script exhausted");
  int ch = keys_.front();
  keys_.pop_front();
  return ch;
}

void HeadlessTerminal::push_keys(const std::string& keys) {
  for (char c : keys) keys_.push_back(static_cast<unsigned char>(c));
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string s;
  if (row < 0 || row >= rows_) return s;
  for (const auto& c : cells_[row]) s += c;
  return s;
}

const std::string& HeadlessTerminal::cell(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return kBlank;
  return cells_[row][col];
}

int HeadlessTerminal::color_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return 0;
  return colors_[row][col];
}

bool HeadlessTerminal::contains(const std::string& needle) const {
  for (int r = 0; r < rows_; ++r) if (row_text(r).find(needle) != std::string::npos) return true;
  return false;
}
