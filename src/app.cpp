#include "app.hpp"
#include "log.hpp"
#include <ncurses.h>

App::App(NoteStore& store, bool mouse, bool color)
    : interaction_(store, term_.get_size()), mouse_(mouse) {
  term_.set_color(color);
}

void App::run() {
  log_info("app", "session started with " + std::to_string(interaction_.snapshot().size()) + " notes");
  while (!interaction_.should_quit()) {
    render();
    int ch = getch();
    if (ch == ERR) continue;
    handle_key(ch);
  }
  log_info("app", "session ended");
}

void App::render() {
  renderer_.render(term_, compose_frame(interaction_.view()));
}

void App::handle_key(int ch) {
  if (ch == KEY_RESIZE) { interaction_.resize(term_.get_size()); return; }
  if (mouse_ && ch == KEY_MOUSE) { handle_mouse(); return; }
  Mode before = interaction_.mode();
  interaction_.handle(input_.translate(ch, before));
  if (interaction_.mode() != before) input_.reset();
}

void App::handle_mouse() {
  MEVENT me; if (getmouse(&me) != OK) return;
  PointerEvent ev;
  ev.row = me.y;
  ev.col = me.x;
  #ifdef BUTTON4_PRESSED
  if (me.bstate & BUTTON4_PRESSED) { ev.kind = PointerKind::WheelUp; interaction_.handle_pointer(ev); return; }
  #endif
  #ifdef BUTTON5_PRESSED
  if (me.bstate & BUTTON5_PRESSED) { ev.kind = PointerKind::WheelDown; interaction_.handle_pointer(ev); return; }
  #endif
  if (me.bstate & (BUTTON1_CLICKED | BUTTON1_PRESSED)) {
    ev.kind = PointerKind::Click;
    interaction_.handle_pointer(ev);
  }
}
