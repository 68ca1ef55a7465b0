#pragma once
/*
 * Interaction
 *
 * Purpose: the note browser state machine; turns input events into store calls,
 * selection changes and draft edits.
 * States: Normal | Create(draft) | Edit(note id, draft).
 * Snapshot: the note list as last read from the store; selection indexes into it.
 * Constraint: never mutates a Note directly; drafts reach the store only on save.
 */
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "draft.hpp"
#include "frame.hpp"
#include "note.hpp"
#include "note_store.hpp"
#include "types.hpp"

enum class Action {
  None,
  Quit,
  NewNote,
  EditNote,
  DeleteNote,
  SelectPrev,
  SelectNext,
  SelectFirst,
  SelectLast,
  ScrollPreviewUp,
  ScrollPreviewDown,
  Cancel,
  Save,
  SwitchField,
  InsertText,
  Backspace,
  CaretLeft,
  CaretRight,
  Newline,
};

struct InputEvent {
  Action action = Action::None;
  std::string text; // InsertText payload: one printable character (UTF-8)
};

enum class PointerKind { Click, WheelUp, WheelDown };

struct PointerEvent {
  PointerKind kind = PointerKind::Click;
  int row = 0;
  int col = 0;
};

struct NormalState {};
struct CreateState { Draft draft; };
struct EditState { NoteId note_id = 0; Draft draft; };
using ModeState = std::variant<NormalState, CreateState, EditState>;

class Interaction {
public:
  explicit Interaction(NoteStore& store, TermSize size = TermSize{24, 80});

  void handle(const InputEvent& ev);
  void handle_pointer(const PointerEvent& ev);
  void resize(TermSize size);
  void reload();

  Mode mode() const;
  const Draft* draft() const;
  std::optional<NoteId> editing_id() const;
  const std::vector<Note>& snapshot() const { return notes_; }
  int selection() const { return selection_; }
  const Note* selected() const;
  int list_top() const { return list_top_; }
  int preview_top() const { return preview_top_; }
  TermSize size() const { return size_; }
  const std::string& error() const { return error_; }
  const std::string& message() const { return message_; }
  bool should_quit() const { return should_quit_; }

  // sidebar row/col -> snapshot index; nullopt outside the list
  std::optional<int> index_at(int row, int col) const;
  ViewState view() const;

private:
  void handle_normal(const InputEvent& ev);
  void handle_editing(Draft& draft, const InputEvent& ev);
  void begin_create();
  void begin_edit();
  void delete_selected();
  void save();
  void cancel();
  void select(int idx);
  void select_id(NoteId id);
  void scroll_preview(int delta);
  void keep_selection_visible();
  Draft* draft_mut();

  NoteStore& store_;
  ModeState state_;
  std::vector<Note> notes_;
  int selection_ = 0;
  int list_top_ = 0;
  int preview_top_ = 0;
  TermSize size_;
  std::string error_;
  std::string message_;
  bool should_quit_ = false;
};
