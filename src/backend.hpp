#pragma once
/*
 * INoteBackend
 *
 * Purpose: durable persistence of the whole note collection.
 * Contract: save_all replaces everything persisted; load_all returns an empty
 * collection (not an error) when nothing was persisted yet.
 * Goal: decouple the store from the medium (file/memory/mirror), enable testing.
 */
#include <string>
#include <vector>
#include "note.hpp"

class INoteBackend {
public:
  virtual ~INoteBackend() = default;
  virtual bool save_all(const std::vector<Note>& notes, std::string& msg) = 0;
  virtual bool load_all(std::vector<Note>& out, std::string& msg) = 0;
  virtual std::string describe() const = 0;
};
