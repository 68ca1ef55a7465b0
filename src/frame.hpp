#pragma once
/*
 * Frame
 *
 * Purpose: pure composition of the screen from view state.
 * Output: styled spans plus an optional cursor; painting is the Renderer's job.
 * Constraint: no side effects; the same ViewState always yields the same Frame.
 */
#include <optional>
#include <string>
#include <vector>
#include "draft.hpp"
#include "markdown.hpp"
#include "note.hpp"
#include "style.hpp"
#include "types.hpp"

struct ViewState {
  Mode mode = Mode::Normal;
  TermSize size{};
  const std::vector<Note>* notes = nullptr;
  int selection = 0;
  int list_top = 0;
  int preview_top = 0;
  const Draft* draft = nullptr; // set in Create/Edit
  std::string message;
  std::string error;
  bool persistent = true;
};

struct Span {
  int row = 0;
  int col = 0;
  std::string text;
  Style style = Style::Normal;
};

struct Frame {
  TermSize size{};
  std::vector<Span> spans;
  std::optional<CursorPos> cursor;
};

Frame compose_frame(const ViewState& view);

bool frame_too_small(TermSize size);
// sidebar second line: first content line, cut at TERMNOTES_PREVIEW_CHARS bytes
std::string note_description(const Note& note);
// title, rule and rendered content as shown in the preview pane
std::vector<StyledLine> preview_body(const Note& note, int width);
