#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: step over whole code points in byte strings (caret moves, truncation).
 * Note: one code point counts as one terminal column.
 */
#include <cstddef>
#include <string>

size_t utf8_next(const std::string& s, size_t pos);
size_t utf8_prev(const std::string& s, size_t pos);
size_t utf8_length(const std::string& s);
// expected byte length of a sequence starting with lead, 0 if lead is invalid
int utf8_sequence_length(unsigned char lead);
// at most max_cols code points, never splitting a sequence
std::string utf8_truncate(const std::string& s, int max_cols);
// skip the first cols code points
std::string utf8_skip(const std::string& s, int cols);
