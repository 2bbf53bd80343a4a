#include "text_width.hpp"
#include <cwchar>

static char32_t decode(const std::string& s, size_t i, size_t& len) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  int extra = 0;
  char32_t cp = c;
  if (c >= 0xF0) { extra = 3; cp = c & 0x07; }
  else if (c >= 0xE0) { extra = 2; cp = c & 0x0F; }
  else if (c >= 0xC0) { extra = 1; cp = c & 0x1F; }
  len = 1;
  for (int k = 0; k < extra && i + len < s.size(); ++k) {
    unsigned char cc = static_cast<unsigned char>(s[i + len]);
    if ((cc & 0xC0) != 0x80) break;
    cp = (cp << 6) | (cc & 0x3F);
    len++;
  }
  return cp;
}

std::string next_glyph(const std::string& s, size_t& i, int& columns) {
  size_t len = 0;
  char32_t cp = decode(s, i, len);
  int w = ::wcwidth(static_cast<wchar_t>(cp));
  columns = w < 0 ? 1 : w;
  std::string g = s.substr(i, len);
  i += len;
  return g;
}

int display_width(const std::string& s) {
  int total = 0;
  size_t i = 0;
  while (i < s.size()) {
    int w = 0;
    next_glyph(s, i, w);
    total += w;
  }
  return total;
}

std::string clip_to_width(const std::string& s, int width) {
  if (width <= 0) return std::string();
  int used = 0;
  size_t i = 0;
  while (i < s.size()) {
    size_t at = i;
    int w = 0;
    next_glyph(s, i, w);
    if (used + w > width) return s.substr(0, at);
    used += w;
  }
  return s;
}
