#include "layout.hpp"
#include <algorithm>

// leftover units go to the leading regions
std::vector<Rect> split_even(const Rect& area, int n, Axis axis) {
  std::vector<Rect> out;
  if (n <= 0) return out;
  out.reserve(n);
  int total = axis == Axis::Horizontal ? area.width : area.height;
  total = std::max(0, total);
  int base = total / n;
  int extra = total % n;
  int offset = 0;
  for (int i = 0; i < n; ++i) {
    int len = base + (i < extra ? 1 : 0);
    if (axis == Axis::Horizontal) out.push_back(Rect{area.row, area.col + offset, area.height, len});
    else out.push_back(Rect{area.row + offset, area.col, len, area.width});
    offset += len;
  }
  return out;
}

Rect center_rect(const Rect& area, int width, int height) {
  int w = std::clamp(width, 0, std::max(0, area.width));
  int h = std::clamp(height, 0, std::max(0, area.height));
  return Rect{area.row + (area.height - h) / 2, area.col + (area.width - w) / 2, h, w};
}

Rect inner_rect(const Rect& area) {
  if (area.width <= 2 || area.height <= 2) return Rect{area.row, area.col, 0, 0};
  return Rect{area.row + 1, area.col + 1, area.height - 2, area.width - 2};
}
