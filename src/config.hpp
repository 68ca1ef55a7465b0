#pragma once

/*compile-time defaults; runtime options come from the rc file and argv*/

#ifndef TERMNOTES_DIR_NAME
#define TERMNOTES_DIR_NAME ".termnotes"
#endif

#ifndef TERMNOTES_NOTES_FILE
#define TERMNOTES_NOTES_FILE "notes.json"
#endif

#ifndef TERMNOTES_LOG_FILE
#define TERMNOTES_LOG_FILE "termnotes.log"
#endif

#ifndef TERMNOTES_RC_FILE
#define TERMNOTES_RC_FILE ".termnotesrc"
#endif

#define TERMNOTES_UNTITLED "Untitled"

// below this the UI shows a fixed "too small" frame
#define TERMNOTES_MIN_COLS 40
#define TERMNOTES_MIN_ROWS 10

// sidebar geometry, shared by rendering and pointer mapping
#define TERMNOTES_LIST_HEADER_ROWS 2
#define TERMNOTES_LIST_ROW_HEIGHT 3

#define TERMNOTES_PREVIEW_CHARS 50
#define TERMNOTES_RULE_MAX 80
