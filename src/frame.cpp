#include "frame.hpp"
#include "config.hpp"
#include "pane_layout.hpp"
#include "utf8.hpp"
#include <algorithm>

static std::string repeat(const std::string& s, int n) {
  std::string out;
  for (int i = 0; i < n; ++i) out += s;
  return out;
}

static void put(Frame& f, int row, int col, const std::string& text, Style style, int max_cols) {
  if (row < 0 || row >= f.size.rows || col < 0 || col >= f.size.cols || max_cols <= 0) return;
  int room = std::min(max_cols, f.size.cols - col);
  std::string t = utf8_truncate(text, room);
  if (t.empty()) return;
  f.spans.push_back(Span{row, col, std::move(t), style});
}

bool frame_too_small(TermSize size) {
  return size.cols < TERMNOTES_MIN_COLS || size.rows < TERMNOTES_MIN_ROWS;
}

std::string note_description(const Note& note) {
  size_t eol = note.content.find('\n');
  std::string first = note.content.substr(0, eol);
  if (!first.empty() && first.back() == '\r') first.pop_back();
  if (first.empty()) return "No content";
  if (first.size() > TERMNOTES_PREVIEW_CHARS) {
    size_t cut = TERMNOTES_PREVIEW_CHARS;
    while (cut > 0 && (static_cast<unsigned char>(first[cut]) & 0xC0) == 0x80) cut--;
    first = first.substr(0, cut) + "...";
  }
  return first;
}

std::vector<StyledLine> preview_body(const Note& note, int width) {
  std::vector<StyledLine> lines;
  lines.push_back({note.title, Style::Title});
  lines.push_back({repeat("─", std::min(std::max(0, width), TERMNOTES_RULE_MAX)), Style::Border});
  lines.push_back({"", Style::Normal});
  std::vector<StyledLine> body;
  std::string msg;
  if (!render_markdown(note.content, width, body, msg)) body = wrap_plain(note.content, width);
  lines.insert(lines.end(), body.begin(), body.end());
  return lines;
}

static void compose_sidebar(Frame& f, const ViewState& v, const Rect& area) {
  put(f, area.row, area.col + 1, "Notes", Style::Title, area.width - 1);
  const std::vector<Note>& notes = *v.notes;
  if (notes.empty()) {
    put(f, area.row + TERMNOTES_LIST_HEADER_ROWS, area.col + 2, "No notes yet.", Style::Muted, area.width - 2);
    put(f, area.row + TERMNOTES_LIST_HEADER_ROWS + 1, area.col + 2, "Press n to create one.", Style::Muted, area.width - 2);
    return;
  }
  int top = std::clamp(v.list_top, 0, static_cast<int>(notes.size()) - 1);
  for (int i = top; i < static_cast<int>(notes.size()); ++i) {
    int row = area.row + TERMNOTES_LIST_HEADER_ROWS + (i - top) * TERMNOTES_LIST_ROW_HEIGHT;
    if (row + 1 >= area.row + area.height) break;
    bool sel = (i == v.selection);
    const Note& n = notes[i];
    put(f, row, area.col, (sel ? "│ " : "  ") + n.title, sel ? Style::Selected : Style::Normal, area.width);
    put(f, row + 1, area.col, (sel ? "│ " : "  ") + note_description(n), sel ? Style::SelectedMuted : Style::Muted, area.width);
  }
}

static void compose_preview(Frame& f, const ViewState& v, const Rect& area) {
  int width = area.width - 1;
  if (width <= 0) return;
  const std::vector<Note>& notes = *v.notes;
  if (notes.empty() || v.selection < 0 || v.selection >= static_cast<int>(notes.size())) {
    put(f, area.row, area.col + 1, "No note selected", Style::Muted, width);
    return;
  }
  auto lines = preview_body(notes[v.selection], width);
  int top = std::clamp(v.preview_top, 0, std::max(0, static_cast<int>(lines.size()) - 1));
  for (int r = 0; r < area.height && top + r < static_cast<int>(lines.size()); ++r) {
    const StyledLine& l = lines[top + r];
    put(f, area.row + r, area.col + 1, l.text, l.style, width);
  }
}

static void compose_normal(Frame& f, const ViewState& v) {
  ScreenLayout l = compute_layout(f.size);
  compose_sidebar(f, v, l.sidebar);
  for (int r = 0; r < l.sidebar.height; ++r) put(f, r, l.divider_col, "│", Style::Border, 1);
  compose_preview(f, v, l.preview);

  std::string status = "NORMAL  " + std::to_string(v.notes->size()) + (v.notes->size() == 1 ? " note" : " notes");
  if (!v.persistent) status += "  [memory]";
  if (!v.message.empty()) status += "  | " + v.message;
  const std::string help = "n:new  e:edit  d:delete  q:quit";
  int used = static_cast<int>(utf8_length(status));
  int help_col = f.size.cols - static_cast<int>(help.size()) - 1;
  put(f, l.status_row, 0, status, Style::Status, f.size.cols);
  if (help_col > used + 2) put(f, l.status_row, help_col, help, Style::Muted, static_cast<int>(help.size()));
}

struct CaretSpot {
  int line = 0;
  int col = 0;
};

static CaretSpot caret_spot(const std::string& text, size_t caret) {
  caret = std::min(caret, text.size());
  CaretSpot s;
  size_t line_start = 0;
  for (size_t i = 0; i < caret; ++i) {
    if (text[i] == '\n') { s.line++; line_start = i + 1; }
  }
  s.col = static_cast<int>(utf8_length(text.substr(line_start, caret - line_start)));
  return s;
}

static std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> out;
  size_t st = 0;
  while (true) {
    size_t pos = s.find('\n', st);
    if (pos == std::string::npos) { out.push_back(s.substr(st)); break; }
    out.push_back(s.substr(st, pos - st));
    st = pos + 1;
  }
  return out;
}

static void compose_edit(Frame& f, const ViewState& v) {
  const Draft& d = *v.draft;
  int cols = f.size.cols;
  int field_cols = cols - 2;
  put(f, 0, 0, v.mode == Mode::Create ? "Create New Note" : "Edit Note", Style::Title, cols);
  put(f, 1, 0, repeat("─", std::min(cols, TERMNOTES_RULE_MAX)), Style::Border, cols);

  bool title_active = d.active == Field::Title;
  CaretSpot title_spot = caret_spot(d.title, title_active ? d.caret : d.title.size());
  int title_left = title_active ? std::max(0, title_spot.col - (field_cols - 1)) : 0;
  put(f, 2, 0, "Title (Tab to switch fields):", Style::Muted, cols);
  put(f, 3, 0, title_active ? "> " : "  ", title_active ? Style::Title : Style::Muted, 2);
  put(f, 3, 2, utf8_skip(d.title, title_left), Style::Normal, field_cols);

  put(f, 4, 0, "Content:", Style::Muted, cols);
  const int content_row = 5;
  int content_rows = std::max(1, f.size.rows - 2 - content_row);
  auto lines = split_lines(d.content);
  CaretSpot spot = caret_spot(d.content, title_active ? 0 : d.caret);
  int top = title_active ? 0 : std::max(0, spot.line - (content_rows - 1));
  int left = title_active ? 0 : std::max(0, spot.col - (field_cols - 1));
  for (int r = 0; r < content_rows && top + r < static_cast<int>(lines.size()); ++r) {
    int idx = top + r;
    bool caret_line = !title_active && idx == spot.line;
    if (caret_line) put(f, content_row + r, 0, "> ", Style::Title, 2);
    put(f, content_row + r, 2, utf8_skip(lines[idx], left), Style::Normal, field_cols);
  }

  put(f, f.size.rows - 2, 0, "Ctrl+S: Save  |  Esc: Cancel  |  Tab: Switch field", Style::Muted, cols);
  if (!v.error.empty()) put(f, f.size.rows - 1, 0, "Error: " + v.error, Style::Error, cols);
  else if (!v.message.empty()) put(f, f.size.rows - 1, 0, v.message, Style::Muted, cols);

  if (title_active) f.cursor = CursorPos{3, std::min(cols - 1, 2 + title_spot.col - title_left)};
  else f.cursor = CursorPos{content_row + spot.line - top, std::min(cols - 1, 2 + spot.col - left)};
}

Frame compose_frame(const ViewState& view) {
  Frame f;
  f.size = view.size;
  if (frame_too_small(view.size)) {
    put(f, 0, 0, "Terminal too small. Please resize.", Style::Normal, view.size.cols);
    return f;
  }
  static const std::vector<Note> no_notes;
  ViewState v = view;
  if (!v.notes) v.notes = &no_notes;
  if (v.mode != Mode::Normal && v.draft) compose_edit(f, v);
  else compose_normal(f, v);
  return f;
}
