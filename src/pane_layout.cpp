#include "pane_layout.hpp"
#include "config.hpp"
#include <algorithm>

static int clamp_split(int total, float ratio) {
  if (total <= 1) return total;
  int primary = static_cast<int>(total * ratio);
  primary = std::clamp(primary, 1, total - 1);
  return primary;
}

ScreenLayout compute_layout(TermSize size) {
  ScreenLayout l;
  int body_rows = std::max(0, size.rows - 1);
  l.status_row = body_rows;
  if (size.cols < 3) {
    l.sidebar = Rect{0, 0, body_rows, std::max(0, size.cols)};
    l.divider_col = size.cols;
    l.preview = Rect{0, size.cols, body_rows, 0};
    return l;
  }
  int left_w = clamp_split(size.cols - 1, 1.0f / 3.0f);
  l.sidebar = Rect{0, 0, body_rows, left_w};
  l.divider_col = left_w;
  l.preview = Rect{0, left_w + 1, body_rows, size.cols - left_w - 1};
  return l;
}

int visible_list_items(TermSize size) {
  int rows = std::max(0, size.rows - 1) - TERMNOTES_LIST_HEADER_ROWS;
  return std::max(1, rows / TERMNOTES_LIST_ROW_HEIGHT);
}

bool rect_contains(const Rect& r, int row, int col) {
  return row >= r.row && row < r.row + r.height && col >= r.col && col < r.col + r.width;
}
