#pragma once
/*
 * Markdown
 *
 * Purpose: turn note content into styled, width-wrapped lines for the preview.
 * Parsing: CommonMark via libcmark; the block tree is flattened into lines with
 * list markers, quote bars and code indentation as prefixes.
 * Inline: emphasis markers are dropped, a paragraph that is entirely strong or
 * emphasized takes that style, links show their target after the text.
 * Line breaks inside a paragraph are kept, as typed.
 * Failure: returns false with msg; callers fall back to wrap_plain().
 */
#include <string>
#include <vector>
#include "style.hpp"

struct StyledLine {
  std::string text;
  Style style = Style::Normal;
};

bool render_markdown(const std::string& source, int width, std::vector<StyledLine>& out, std::string& msg);

// raw text split on newlines and wrapped, no markup interpretation
std::vector<StyledLine> wrap_plain(const std::string& source, int width);

// greedy word wrap; words longer than the width are split
std::vector<std::string> wrap_words(const std::string& text, int width);
