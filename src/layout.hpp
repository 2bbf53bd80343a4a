#pragma once
/*
 * Layout
 *
 * Purpose: screen rectangles and the area arithmetic widgets share.
 * split_even: N regions in order along an axis, summing to the area, sizes differ by at most one.
 */
#include <vector>

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
  bool operator==(const Rect&) const = default;
};

enum class Axis { Horizontal, Vertical };

std::vector<Rect> split_even(const Rect& area, int n, Axis axis);
Rect center_rect(const Rect& area, int width, int height);
Rect inner_rect(const Rect& area);
