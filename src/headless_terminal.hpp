#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Model: a rows x cols grid of code points with a style per cell.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  explicit HeadlessTerminal(TermSize size);

  TermSize get_size() const override { return size_; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text, Style style) override;
  void move_cursor(int row, int col) override { cursor_ = CursorPos{row, col}; }
  void show_cursor(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { ++refreshes_; }

  void resize(TermSize size);
  // row text with trailing blanks removed
  std::string line(int row) const;
  Style style_at(int row, int col) const;
  bool contains(const std::string& text) const;
  CursorPos cursor() const { return cursor_; }
  bool cursor_visible() const { return cursor_visible_; }
  int refresh_count() const { return refreshes_; }

private:
  TermSize size_;
  std::vector<std::vector<std::string>> cells_;
  std::vector<std::vector<Style>> styles_;
  CursorPos cursor_{};
  bool cursor_visible_ = false;
  int refreshes_ = 0;
};
