#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing; maps Style to
 * color pairs/attributes.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal();
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text, Style style) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;
  void set_color(bool enabled) { color_ = enabled && has_colors(); }
private:
  attr_t attr_for(Style style) const;
  bool color_ = false;
};
