#pragma once
/*
 * NoteStore
 *
 * Purpose: authoritative in-memory note collection; assigns ids and timestamps,
 * pushes the full collection to the backend after every mutation.
 * Backend: optional; without one the store is purely in-memory.
 * Sync policy:
 *   Soft - a failed save is logged and remembered, the mutation still succeeds.
 *   Hard - a failed save fails the mutation and rolls the collection back.
 * Absent ids: update/remove are silent no-ops that succeed without a save.
 */
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "backend.hpp"
#include "note.hpp"

enum class SyncPolicy { Soft, Hard };

class NoteStore {
public:
  using Clock = std::function<Timestamp()>;

  explicit NoteStore(std::unique_ptr<INoteBackend> backend, SyncPolicy policy = SyncPolicy::Soft);

  // loads the backend collection; a failure leaves the store unusable
  bool init(std::string& msg);

  bool create(const std::string& title, const std::string& content, Note& out, std::string& msg);
  bool update(NoteId id, const std::string& title, const std::string& content, std::string& msg);
  bool remove(NoteId id, std::string& msg);
  std::optional<Note> get(NoteId id) const;
  // most recently updated first; equal stamps keep insertion order
  std::vector<Note> list() const;

  bool contains(NoteId id) const;
  size_t size() const { return notes_.size(); }
  bool ready() const { return ready_; }

  void set_clock(Clock clock) { clock_ = std::move(clock); }
  SyncPolicy policy() const { return policy_; }
  bool persistent() const { return backend_ != nullptr; }

  const std::string& last_sync_error() const { return last_sync_error_; }
  int sync_failures() const { return sync_failures_; }

private:
  Timestamp next_stamp();
  bool sync(std::string& msg);
  std::vector<Note>::iterator find(NoteId id);
  std::vector<Note>::const_iterator find(NoteId id) const;

  std::unique_ptr<INoteBackend> backend_;
  SyncPolicy policy_;
  Clock clock_;
  std::vector<Note> notes_;
  NoteId next_id_ = 1;
  Timestamp last_stamp_{};
  bool ready_ = false;
  std::string last_sync_error_;
  int sync_failures_ = 0;
};
