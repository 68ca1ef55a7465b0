#include "note_store.hpp"
#include "log.hpp"
#include <algorithm>
#include <limits>

NoteStore::NoteStore(std::unique_ptr<INoteBackend> backend, SyncPolicy policy)
  : backend_(std::move(backend)), policy_(policy), clock_(now_timestamp) {}

bool NoteStore::init(std::string& msg) {
  ready_ = false;
  notes_.clear();
  next_id_ = 1;
  last_stamp_ = Timestamp{};
  if (backend_) {
    std::vector<Note> loaded;
    if (!backend_->load_all(loaded, msg)) {
      msg = "failed to load notes from backend: " + msg;
      log_error("store", msg);
      return false;
    }
    for (const auto& n : loaded) {
      if (n.id <= 0 || contains(n.id)) {
        msg = "failed to load notes from backend: invalid or duplicate id " + std::to_string(n.id);
        log_error("store", msg);
        notes_.clear();
        return false;
      }
      if (n.id == std::numeric_limits<NoteId>::max()) {
        msg = "failed to load notes from backend: id " + std::to_string(n.id) + " leaves no room for new notes";
        log_error("store", msg);
        notes_.clear();
        return false;
      }
      next_id_ = std::max(next_id_, n.id + 1);
      last_stamp_ = std::max(last_stamp_, n.updated_at);
      notes_.push_back(n);
    }
    log_info("store", msg);
  } else {
    msg = "no backend, notes are not persisted";
    log_info("store", msg);
  }
  ready_ = true;
  return true;
}

Timestamp NoteStore::next_stamp() {
  Timestamp t = clock_();
  if (t <= last_stamp_) t = last_stamp_ + std::chrono::nanoseconds(1);
  last_stamp_ = t;
  return t;
}

std::vector<Note>::iterator NoteStore::find(NoteId id) {
  return std::find_if(notes_.begin(), notes_.end(), [id](const Note& n) { return n.id == id; });
}

std::vector<Note>::const_iterator NoteStore::find(NoteId id) const {
  return std::find_if(notes_.begin(), notes_.end(), [id](const Note& n) { return n.id == id; });
}

bool NoteStore::contains(NoteId id) const { return find(id) != notes_.end(); }

bool NoteStore::sync(std::string& msg) {
  if (!backend_) return true;
  std::string m;
  if (backend_->save_all(list(), m)) {
    last_sync_error_.clear();
    return true;
  }
  ++sync_failures_;
  last_sync_error_ = m;
  if (policy_ == SyncPolicy::Hard) {
    msg = "failed to save notes: " + m;
    log_error("store", msg);
    return false;
  }
  log_warn("store", "sync failed, keeping in-memory change: " + m);
  return true;
}

bool NoteStore::create(const std::string& title, const std::string& content, Note& out, std::string& msg) {
  if (!ready_) { msg = "store is not initialized"; return false; }
  if (next_id_ == std::numeric_limits<NoteId>::max()) {
    msg = "note ids exhausted";
    log_error("store", msg);
    return false;
  }
  Note n;
  n.id = next_id_;
  n.title = title;
  n.content = content;
  n.created_at = next_stamp();
  n.updated_at = n.created_at;
  notes_.push_back(n);
  if (!sync(msg)) {
    notes_.pop_back();
    return false;
  }
  ++next_id_;
  out = n;
  msg = "created note " + std::to_string(n.id);
  return true;
}

bool NoteStore::update(NoteId id, const std::string& title, const std::string& content, std::string& msg) {
  if (!ready_) { msg = "store is not initialized"; return false; }
  auto it = find(id);
  if (it == notes_.end()) {
    msg = "no note " + std::to_string(id);
    return true;
  }
  Note before = *it;
  it->title = title;
  it->content = content;
  it->updated_at = next_stamp();
  if (!sync(msg)) {
    // sync never reorders notes_, so the lookup is still valid
    *find(id) = before;
    return false;
  }
  msg = "updated note " + std::to_string(id);
  return true;
}

bool NoteStore::remove(NoteId id, std::string& msg) {
  if (!ready_) { msg = "store is not initialized"; return false; }
  auto it = find(id);
  if (it == notes_.end()) {
    msg = "no note " + std::to_string(id);
    return true;
  }
  size_t pos = static_cast<size_t>(it - notes_.begin());
  Note removed = *it;
  notes_.erase(it);
  if (!sync(msg)) {
    notes_.insert(notes_.begin() + static_cast<std::ptrdiff_t>(pos), removed);
    return false;
  }
  msg = "deleted note " + std::to_string(id);
  return true;
}

std::optional<Note> NoteStore::get(NoteId id) const {
  auto it = find(id);
  if (it == notes_.end()) return std::nullopt;
  return *it;
}

std::vector<Note> NoteStore::list() const {
  std::vector<Note> out = notes_;
  std::stable_sort(out.begin(), out.end(), [](const Note& a, const Note& b) { return a.updated_at > b.updated_at; });
  return out;
}
