#pragma once
/*
 * JSON codec
 *
 * Purpose: notes file encoding, an indented array of
 *   {"ID", "Title", "Content", "CreatedAt", "UpdatedAt"} records in that key order.
 * Decode: key match is case-insensitive; "null" and "[]" both mean no notes.
 */
#include <string>
#include <vector>
#include "note.hpp"

std::string encode_notes(const std::vector<Note>& notes);
bool decode_notes(const std::string& text, std::vector<Note>& out, std::string& msg);
