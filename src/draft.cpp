#include "draft.hpp"
#include "utf8.hpp"
#include <algorithm>

void Draft::insert_text(const std::string& text) {
  if (text.empty()) return;
  std::string& s = active_text();
  caret = std::min(caret, s.size());
  s.insert(caret, text);
  caret += text.size();
}

void Draft::newline() {
  if (active == Field::Title) { focus(Field::Content); return; }
  insert_text("\n");
}

void Draft::backspace() {
  std::string& s = active_text();
  caret = std::min(caret, s.size());
  if (caret == 0) return;
  size_t prev = utf8_prev(s, caret);
  s.erase(prev, caret - prev);
  caret = prev;
}

void Draft::move_left() {
  caret = utf8_prev(active_text(), std::min(caret, active_text().size()));
}

void Draft::move_right() {
  caret = utf8_next(active_text(), caret);
}

void Draft::switch_field() {
  focus(active == Field::Title ? Field::Content : Field::Title);
}

void Draft::focus(Field field) {
  active = field;
  caret = active_text().size();
}
