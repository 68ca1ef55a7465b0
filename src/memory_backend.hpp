#pragma once
/*
 * MemoryBackend
 *
 * Purpose: INoteBackend that keeps the last saved collection in process memory.
 * Usage: tests, and sessions that want a backend without touching disk.
 */
#include "backend.hpp"

class MemoryBackend : public INoteBackend {
public:
  MemoryBackend() = default;
  explicit MemoryBackend(std::vector<Note> seed) : notes_(std::move(seed)) {}

  bool save_all(const std::vector<Note>& notes, std::string& msg) override {
    notes_ = notes;
    ++saves_;
    msg = "saved " + std::to_string(notes.size()) + " notes in memory";
    return true;
  }
  bool load_all(std::vector<Note>& out, std::string& msg) override {
    out = notes_;
    msg = "loaded " + std::to_string(out.size()) + " notes from memory";
    return true;
  }
  std::string describe() const override { return "memory"; }

  const std::vector<Note>& notes() const { return notes_; }
  int save_count() const { return saves_; }

private:
  std::vector<Note> notes_;
  int saves_ = 0;
};
