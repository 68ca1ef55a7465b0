#include "input.hpp"
#include "utf8.hpp"
#include <ncurses.h>

static constexpr int CTRL_c = 'C' - 64;
static constexpr int CTRL_d = 'D' - 64;
static constexpr int CTRL_h = 'H' - 64;
static constexpr int CTRL_s = 'S' - 64;
static constexpr int CTRL_u = 'U' - 64;
static constexpr int ESC = 27;
static constexpr int DEL = 127;

static bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }

InputEvent Input::translate(int ch, Mode mode) {
  if (mode == Mode::Normal) {
    reset();
    return translate_normal(ch);
  }
  return translate_editing(ch);
}

void Input::reset() {
  pending_utf8_.clear();
  pending_len_ = 0;
}

InputEvent Input::translate_normal(int ch) {
  switch (ch) {
    case 'q': case CTRL_c: return {Action::Quit, {}};
    case 'n': return {Action::NewNote, {}};
    case 'e': return {Action::EditNote, {}};
    case 'd': return {Action::DeleteNote, {}};
    case 'k': case KEY_UP: return {Action::SelectPrev, {}};
    case 'j': case KEY_DOWN: return {Action::SelectNext, {}};
    case 'g': case KEY_HOME: return {Action::SelectFirst, {}};
    case 'G': case KEY_END: return {Action::SelectLast, {}};
    case CTRL_u: case KEY_PPAGE: return {Action::ScrollPreviewUp, {}};
    case CTRL_d: case KEY_NPAGE: return {Action::ScrollPreviewDown, {}};
    default: break;
  }
  if (is_enter(ch)) return {Action::EditNote, {}};
  return {};
}

InputEvent Input::translate_editing(int ch) {
  if (ch >= 0x80 && ch <= 0xFF) {
    unsigned char b = static_cast<unsigned char>(ch);
    if (pending_len_ == 0) {
      int len = utf8_sequence_length(b);
      if (len < 2) return {};
      pending_utf8_.assign(1, static_cast<char>(b));
      pending_len_ = len;
      return {};
    }
    if ((b & 0xC0) != 0x80) { reset(); return {}; }
    pending_utf8_.push_back(static_cast<char>(b));
    if (static_cast<int>(pending_utf8_.size()) < pending_len_) return {};
    InputEvent ev{Action::InsertText, pending_utf8_};
    reset();
    return ev;
  }
  reset();
  switch (ch) {
    case ESC: return {Action::Cancel, {}};
    case CTRL_s: return {Action::Save, {}};
    case '\t': return {Action::SwitchField, {}};
    case KEY_BACKSPACE: case DEL: case CTRL_h: return {Action::Backspace, {}};
    case KEY_LEFT: return {Action::CaretLeft, {}};
    case KEY_RIGHT: return {Action::CaretRight, {}};
    default: break;
  }
  if (is_enter(ch)) return {Action::Newline, {}};
  if (ch >= 32 && ch <= 126) return {Action::InsertText, std::string(1, static_cast<char>(ch))};
  return {};
}
