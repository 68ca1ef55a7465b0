#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, styled draw, cursor, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>
#include "style.hpp"
#include "types.hpp"

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text, Style style) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool visible) = 0;
  virtual void refresh() = 0;
};
