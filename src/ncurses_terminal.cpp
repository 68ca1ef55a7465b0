#include "ncurses_terminal.hpp"

enum ColorPair : short {
  PairTitle = 1,
  PairMuted,
  PairSelected,
  PairBorder,
  PairHeading,
  PairCode,
  PairQuote,
  PairError,
};

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
    init_pair(PairTitle, COLOR_BLUE, bg);
    init_pair(PairMuted, COLOR_WHITE, bg);
    init_pair(PairSelected, COLOR_MAGENTA, bg);
    init_pair(PairBorder, COLOR_WHITE, bg);
    init_pair(PairHeading, COLOR_CYAN, bg);
    init_pair(PairCode, COLOR_GREEN, bg);
    init_pair(PairQuote, COLOR_YELLOW, bg);
    init_pair(PairError, COLOR_RED, bg);
    color_ = true;
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

attr_t NcursesTerminal::attr_for(Style style) const {
#ifdef A_ITALIC
  if (style == Style::Emphasis) return A_ITALIC;
#else
  if (style == Style::Emphasis) return A_UNDERLINE;
#endif
  if (!color_) {
    switch (style) {
      case Style::Title: case Style::Heading: case Style::Error: case Style::Strong: return A_BOLD;
      case Style::Muted: case Style::Border: case Style::SelectedMuted: return A_DIM;
      case Style::Selected: case Style::Status: return A_REVERSE;
      default: return A_NORMAL;
    }
  }
  switch (style) {
    case Style::Title: return COLOR_PAIR(PairTitle) | A_BOLD;
    case Style::Muted: return COLOR_PAIR(PairMuted) | A_DIM;
    case Style::Selected: return COLOR_PAIR(PairSelected) | A_BOLD;
    case Style::SelectedMuted: return COLOR_PAIR(PairSelected);
    case Style::Border: return COLOR_PAIR(PairBorder) | A_DIM;
    case Style::Heading: return COLOR_PAIR(PairHeading) | A_BOLD;
    case Style::Code: return COLOR_PAIR(PairCode);
    case Style::Quote: return COLOR_PAIR(PairQuote);
    case Style::Error: return COLOR_PAIR(PairError) | A_BOLD;
    case Style::Status: return A_REVERSE;
    case Style::Strong: return A_BOLD;
    case Style::Emphasis: break;
    case Style::Normal: break;
  }
  return A_NORMAL;
}

void NcursesTerminal::draw_text(int row, int col, const std::string& text, Style style) {
  attr_t a = attr_for(style);
  attron(a);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(a);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }
