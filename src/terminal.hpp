#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct before the App; destructor restores terminal.
 * Note: manages terminal modes (raw/noecho/keypad/mouse), not rendering.
 */
#include <ncurses.h>

class Terminal {
public:
  explicit Terminal(bool mouse);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
