#pragma once
/*
 * PaneLayout
 *
 * Purpose: split the screen into sidebar | divider | preview over a status row.
 * Note: shared by frame composition and pointer mapping so both agree on geometry.
 */
#include "types.hpp"

struct ScreenLayout {
  Rect sidebar;
  int divider_col = 0;
  Rect preview;
  int status_row = 0;
};

ScreenLayout compute_layout(TermSize size);
// sidebar items that fit below the list header
int visible_list_items(TermSize size);
bool rect_contains(const Rect& r, int row, int col);
