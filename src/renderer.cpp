#include "renderer.hpp"
#include <algorithm>

void Renderer::render(ITerminal& term, const Frame& frame) {
  term.clear();
  for (const auto& s : frame.spans) term.draw_text(s.row, s.col, s.text, s.style);
  if (frame.cursor) {
    term.show_cursor(true);
    term.move_cursor(frame.cursor->row, frame.cursor->col);
  } else {
    term.show_cursor(false);
    TermSize sz = term.get_size();
    term.move_cursor(std::max(0, sz.rows - 1), 0);
  }
  term.refresh();
}
