#pragma once
/*
 * TextWidth
 *
 * Purpose: terminal column arithmetic for UTF-8 strings.
 * Rule: columns come from wcwidth() under the current LC_CTYPE; unknown or non-printable
 *       code points count as one column, combining marks as zero.
 */
#include <cstddef>
#include <string>

// Splits off the glyph starting at byte i (code point plus its continuation bytes); advances i.
std::string next_glyph(const std::string& s, size_t& i, int& columns);
int display_width(const std::string& s);
// longest prefix that fits in width columns; never splits a glyph
std::string clip_to_width(const std::string& s, int width);
