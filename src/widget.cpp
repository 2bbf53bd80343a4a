#include "widget.hpp"
#include <algorithm>

static std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> lines;
  size_t st = 0;
  while (true) {
    size_t pos = s.find('\n', st);
    if (pos == std::string::npos) { lines.emplace_back(s.substr(st)); break; }
    lines.emplace_back(s.substr(st, pos - st));
    st = pos + 1;
  }
  return lines;
}

Text::Text(std::string content, TextOptions opts) : content_(std::move(content)), opts_(std::move(opts)) {}

void Text::draw_line(ITerminal& term, int row, int col, const std::string& s) const {
  if (s.empty()) return;
  if (opts_.color != 0) term.draw_colored(row, col, s, opts_.color);
  else term.draw_text(row, col, s);
}

void Text::render(const Rect& area, ITerminal& term) const {
  if (area.width <= 0 || area.height <= 0) return;
  if (opts_.centered) {
    std::string line = content_;
    std::replace(line.begin(), line.end(), '\n', ' ');
    // a frame owns the outer ring; centered content stays inside it
    Rect box = opts_.bordered ? inner_rect(area) : area;
    Rect r = center_rect(box, display_width(line), 1);
    draw_line(term, r.row, r.col, clip_to_width(line, r.width));
  } else {
    auto lines = split_lines(content_);
    int n = std::min(static_cast<int>(lines.size()), area.height);
    for (int i = 0; i < n; ++i) draw_line(term, area.row + i, area.col, clip_to_width(lines[i], area.width));
  }
  // frame last: it always covers the full area
  if (opts_.bordered) term.draw_frame(area, opts_.border_title.value_or(std::string()));
}
