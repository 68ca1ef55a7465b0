#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Field/TermSize/Rect).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

enum class Mode { Normal, Create, Edit };

enum class Field { Title, Content };

struct TermSize { int rows = 0; int cols = 0; };

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

struct CursorPos { int row = 0; int col = 0; };
