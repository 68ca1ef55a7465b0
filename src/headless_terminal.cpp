#include "headless_terminal.hpp"
#include "utf8.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(TermSize size) { resize(size); }

void HeadlessTerminal::resize(TermSize size) {
  size_ = size;
  clear();
}

void HeadlessTerminal::clear() {
  cells_.assign(static_cast<size_t>(std::max(0, size_.rows)), std::vector<std::string>(static_cast<size_t>(std::max(0, size_.cols)), " "));
  styles_.assign(static_cast<size_t>(std::max(0, size_.rows)), std::vector<Style>(static_cast<size_t>(std::max(0, size_.cols)), Style::Normal));
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text, Style style) {
  if (row < 0 || row >= size_.rows) return;
  size_t pos = 0;
  while (pos < text.size() && col < size_.cols) {
    size_t next = utf8_next(text, pos);
    if (col >= 0) {
      cells_[row][col] = text.substr(pos, next - pos);
      styles_[row][col] = style;
    }
    pos = next;
    ++col;
  }
}

std::string HeadlessTerminal::line(int row) const {
  if (row < 0 || row >= size_.rows) return std::string();
  std::string s;
  for (const auto& c : cells_[row]) s += c;
  while (!s.empty() && s.back() == ' ') s.pop_back();
  return s;
}

Style HeadlessTerminal::style_at(int row, int col) const {
  if (row < 0 || row >= size_.rows || col < 0 || col >= size_.cols) return Style::Normal;
  return styles_[row][col];
}

bool HeadlessTerminal::contains(const std::string& text) const {
  for (int r = 0; r < size_.rows; ++r) {
    if (line(r).find(text) != std::string::npos) return true;
  }
  return false;
}
