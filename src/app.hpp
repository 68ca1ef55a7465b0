#pragma once
/*
 * App
 *
 * Purpose: the interactive loop; compose a frame, paint it, read one key,
 * route it to the Interaction state machine.
 * Lifetime: construct inside a Terminal scope; the store outlives the App.
 */
#include "input.hpp"
#include "interaction.hpp"
#include "ncurses_terminal.hpp"
#include "note_store.hpp"
#include "renderer.hpp"

class App {
public:
  App(NoteStore& store, bool mouse, bool color);
  void run();

private:
  void render();
  void handle_key(int ch);
  void handle_mouse();

  NcursesTerminal term_;
  Interaction interaction_;
  Renderer renderer_;
  Input input_;
  bool mouse_ = false;
};
