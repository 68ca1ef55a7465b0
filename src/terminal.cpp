#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal(bool mouse) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  if (mouse) {
    mmask_t mask = BUTTON1_CLICKED | BUTTON1_PRESSED | BUTTON4_PRESSED;
#ifdef BUTTON5_PRESSED
    mask |= BUTTON5_PRESSED;
#endif
    mousemask(mask, nullptr);
    mouseinterval(0);
  }
}

Terminal::~Terminal() {
  endwin();
}
