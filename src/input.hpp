#pragma once
#include <string>
#include "interaction.hpp"
/*
 * Input
 *
 * Purpose: translate curses key codes into Interaction events for the current mode.
 * State: assembles multi-byte UTF-8 input delivered one getch() byte at a time.
 */

class Input {
public:
  InputEvent translate(int ch, Mode mode);
  void reset();
private:
  InputEvent translate_normal(int ch);
  InputEvent translate_editing(int ch);
  std::string pending_utf8_;
  int pending_len_ = 0;
};
