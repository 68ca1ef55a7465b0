#include "interaction.hpp"
#include "config.hpp"
#include "log.hpp"
#include "pane_layout.hpp"
#include <algorithm>

Interaction::Interaction(NoteStore& store, TermSize size) : store_(store), state_(NormalState{}), size_(size) {
  reload();
}

Mode Interaction::mode() const {
  if (std::holds_alternative<CreateState>(state_)) return Mode::Create;
  if (std::holds_alternative<EditState>(state_)) return Mode::Edit;
  return Mode::Normal;
}

const Draft* Interaction::draft() const {
  if (auto* c = std::get_if<CreateState>(&state_)) return &c->draft;
  if (auto* e = std::get_if<EditState>(&state_)) return &e->draft;
  return nullptr;
}

Draft* Interaction::draft_mut() {
  if (auto* c = std::get_if<CreateState>(&state_)) return &c->draft;
  if (auto* e = std::get_if<EditState>(&state_)) return &e->draft;
  return nullptr;
}

std::optional<NoteId> Interaction::editing_id() const {
  if (auto* e = std::get_if<EditState>(&state_)) return e->note_id;
  return std::nullopt;
}

const Note* Interaction::selected() const {
  if (selection_ < 0 || selection_ >= static_cast<int>(notes_.size())) return nullptr;
  return &notes_[selection_];
}

void Interaction::reload() {
  notes_ = store_.list();
  int last = std::max(0, static_cast<int>(notes_.size()) - 1);
  selection_ = std::clamp(selection_, 0, last);
  keep_selection_visible();
}

void Interaction::resize(TermSize size) {
  size_ = size;
  keep_selection_visible();
}

void Interaction::handle(const InputEvent& ev) {
  if (Draft* d = draft_mut()) handle_editing(*d, ev);
  else handle_normal(ev);
}

void Interaction::handle_normal(const InputEvent& ev) {
  switch (ev.action) {
    case Action::Quit: should_quit_ = true; break;
    case Action::NewNote: begin_create(); break;
    case Action::EditNote: begin_edit(); break;
    case Action::DeleteNote: delete_selected(); break;
    case Action::SelectPrev: select(selection_ - 1); break;
    case Action::SelectNext: select(selection_ + 1); break;
    case Action::SelectFirst: select(0); break;
    case Action::SelectLast: select(static_cast<int>(notes_.size()) - 1); break;
    case Action::ScrollPreviewUp: scroll_preview(-std::max(1, (size_.rows - 1) / 2)); break;
    case Action::ScrollPreviewDown: scroll_preview(std::max(1, (size_.rows - 1) / 2)); break;
    default: break;
  }
}

void Interaction::handle_editing(Draft& draft, const InputEvent& ev) {
  switch (ev.action) {
    case Action::Cancel: cancel(); break;
    case Action::Save: save(); break;
    case Action::SwitchField: draft.switch_field(); break;
    case Action::InsertText: draft.insert_text(ev.text); break;
    case Action::Backspace: draft.backspace(); break;
    case Action::CaretLeft: draft.move_left(); break;
    case Action::CaretRight: draft.move_right(); break;
    case Action::Newline: draft.newline(); break;
    default: break;
  }
}

void Interaction::begin_create() {
  Draft d;
  d.active = Field::Title;
  d.caret = 0;
  state_ = CreateState{std::move(d)};
  error_.clear();
}

void Interaction::begin_edit() {
  const Note* n = selected();
  if (!n) return;
  Draft d;
  d.title = n->title;
  d.content = n->content;
  d.focus(Field::Title);
  state_ = EditState{n->id, std::move(d)};
  error_.clear();
}

void Interaction::cancel() {
  state_ = NormalState{};
  error_.clear();
  message_ = "discarded changes";
}

void Interaction::save() {
  Draft* d = draft_mut();
  if (!d) return;
  // the placeholder goes to the store only; the draft keeps what was typed
  const std::string title = d->title.empty() ? std::string(TERMNOTES_UNTITLED) : d->title;
  int failures_before = store_.sync_failures();
  std::string msg;
  NoteId target = 0;
  bool ok = false;
  if (auto* e = std::get_if<EditState>(&state_)) {
    target = e->note_id;
    ok = store_.update(target, title, d->content, msg);
  } else {
    Note created;
    ok = store_.create(title, d->content, created, msg);
    target = created.id;
  }
  if (!ok) {
    error_ = msg;
    log_error("ui", "save failed: " + msg);
    return;
  }
  state_ = NormalState{};
  error_.clear();
  reload();
  select_id(target);
  message_ = store_.sync_failures() > failures_before ? "saved in memory only: " + store_.last_sync_error() : "saved";
}

void Interaction::delete_selected() {
  const Note* n = selected();
  if (!n) return;
  NoteId id = n->id;
  std::string title = n->title;
  int failures_before = store_.sync_failures();
  std::string msg;
  if (!store_.remove(id, msg)) {
    message_ = msg;
    log_error("ui", "delete failed: " + msg);
    return;
  }
  reload();
  preview_top_ = 0;
  message_ = store_.sync_failures() > failures_before ? "deleted in memory only: " + store_.last_sync_error()
                                                       : "deleted \"" + title + "\"";
}

void Interaction::select(int idx) {
  if (notes_.empty()) return;
  idx = std::clamp(idx, 0, static_cast<int>(notes_.size()) - 1);
  if (idx != selection_) preview_top_ = 0;
  selection_ = idx;
  keep_selection_visible();
}

void Interaction::select_id(NoteId id) {
  for (size_t i = 0; i < notes_.size(); ++i) {
    if (notes_[i].id == id) { select(static_cast<int>(i)); return; }
  }
}

void Interaction::scroll_preview(int delta) {
  const Note* n = selected();
  if (!n) return;
  ScreenLayout l = compute_layout(size_);
  int total = static_cast<int>(preview_body(*n, std::max(1, l.preview.width - 1)).size());
  int max_top = std::max(0, total - l.preview.height);
  preview_top_ = std::clamp(preview_top_ + delta, 0, max_top);
}

void Interaction::keep_selection_visible() {
  int visible = visible_list_items(size_);
  if (selection_ < list_top_) list_top_ = selection_;
  if (selection_ >= list_top_ + visible) list_top_ = selection_ - visible + 1;
  int max_top = std::max(0, static_cast<int>(notes_.size()) - visible);
  list_top_ = std::clamp(list_top_, 0, max_top);
}

std::optional<int> Interaction::index_at(int row, int col) const {
  ScreenLayout l = compute_layout(size_);
  if (!rect_contains(l.sidebar, row, col)) return std::nullopt;
  int rel = row - l.sidebar.row - TERMNOTES_LIST_HEADER_ROWS;
  if (rel < 0) return std::nullopt;
  int idx = list_top_ + rel / TERMNOTES_LIST_ROW_HEIGHT;
  if (idx >= static_cast<int>(notes_.size())) return std::nullopt;
  return idx;
}

void Interaction::handle_pointer(const PointerEvent& ev) {
  if (mode() != Mode::Normal || frame_too_small(size_)) return;
  ScreenLayout l = compute_layout(size_);
  switch (ev.kind) {
    case PointerKind::Click:
      if (auto idx = index_at(ev.row, ev.col)) select(*idx);
      break;
    case PointerKind::WheelUp:
    case PointerKind::WheelDown: {
      int dir = ev.kind == PointerKind::WheelUp ? -1 : 1;
      if (rect_contains(l.preview, ev.row, ev.col)) scroll_preview(dir * 3);
      else if (rect_contains(l.sidebar, ev.row, ev.col)) select(selection_ + dir);
    } break;
  }
}

ViewState Interaction::view() const {
  ViewState v;
  v.mode = mode();
  v.size = size_;
  v.notes = &notes_;
  v.selection = selection_;
  v.list_top = list_top_;
  v.preview_top = preview_top_;
  v.draft = draft();
  v.message = message_;
  v.error = error_;
  v.persistent = store_.persistent();
  return v;
}
