#pragma once
/*
 * Note
 *
 * Purpose: the single persisted entity.
 * Invariant: id > 0 once stored; created_at <= updated_at.
 */
#include <cstdint>
#include <string>
#include "timestamp.hpp"

using NoteId = std::int64_t;

struct Note {
  NoteId id = 0;
  std::string title;
  std::string content;
  Timestamp created_at{};
  Timestamp updated_at{};

  bool operator==(const Note&) const = default;
};
