#pragma once
/*
 * Draft
 *
 * Purpose: uncommitted title/content text held while creating or editing a note.
 * Caret: byte offset into the active field, always on a UTF-8 code point boundary.
 * Note: titles are single-line; a newline typed in the title moves to the content.
 */
#include <cstddef>
#include <string>
#include "types.hpp"

struct Draft {
  std::string title;
  std::string content;
  Field active = Field::Title;
  size_t caret = 0;

  std::string& active_text() { return active == Field::Title ? title : content; }
  const std::string& active_text() const { return active == Field::Title ? title : content; }

  void insert_text(const std::string& text);
  void newline();
  void backspace();
  void move_left();
  void move_right();
  void switch_field();
  void focus(Field field);
};
