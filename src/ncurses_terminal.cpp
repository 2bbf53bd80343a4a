#include "ncurses_terminal.hpp"
#include "types.hpp"
#include "text_width.hpp"

NcursesTerminal::NcursesTerminal(bool enable_color) {
  color_ = enable_color && has_colors();
  if (!color_) return;
  start_color();
  if (use_default_colors() == OK) {
    init_pair(kPairTitle, COLOR_YELLOW, -1);
    init_pair(kPairDefault, -1, -1);
    init_pair(kPairHit, COLOR_GREEN, -1);
    init_pair(kPairMiss, COLOR_RED, -1);
  } else {
    init_pair(kPairTitle, COLOR_YELLOW, COLOR_BLACK); // fallback
    init_pair(kPairDefault, COLOR_WHITE, COLOR_BLACK);
    init_pair(kPairHit, COLOR_GREEN, COLOR_BLACK);
    init_pair(kPairMiss, COLOR_RED, COLOR_BLACK);
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (color_) attron(COLOR_PAIR(kPairDefault));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (color_) attroff(COLOR_PAIR(kPairDefault));
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (color_) attron(COLOR_PAIR(color_pair_id) | A_BOLD);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (color_) attroff(COLOR_PAIR(color_pair_id) | A_BOLD);
}

void NcursesTerminal::draw_frame(const Rect& area, const std::string& title) {
  if (area.width < 2 || area.height < 2) return;
  int top = area.row, left = area.col;
  int bottom = area.row + area.height - 1, right = area.col + area.width - 1;
  mvhline(top, left + 1, ACS_HLINE, area.width - 2);
  mvhline(bottom, left + 1, ACS_HLINE, area.width - 2);
  mvvline(top + 1, left, ACS_VLINE, area.height - 2);
  mvvline(top + 1, right, ACS_VLINE, area.height - 2);
  mvaddch(top, left, ACS_ULCORNER);
  mvaddch(top, right, ACS_URCORNER);
  mvaddch(bottom, left, ACS_LLCORNER);
  // bottom-right cell of the screen reports ERR after the cursor wraps; the glyph is still drawn
  mvaddch(bottom, right, ACS_LRCORNER);
  if (!title.empty()) {
    std::string t = clip_to_width(title, area.width - 2);
    if (color_) attron(COLOR_PAIR(kPairTitle));
    mvaddnstr(top, left + 1, t.c_str(), (int)t.size());
    if (color_) attroff(COLOR_PAIR(kPairTitle));
  }
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() {
  if (::refresh() == ERR) throw TerminalError("failed to write to terminal");
}

int NcursesTerminal::read_key() {
  int ch = getch();
  if (ch == ERR) throw TerminalError("failed to read from terminal");
  return ch;
}
