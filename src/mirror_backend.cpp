#include "mirror_backend.hpp"

MirrorBackend::MirrorBackend(std::unique_ptr<INoteBackend> primary) : primary_(std::move(primary)) {}

void MirrorBackend::add_replica(std::unique_ptr<INoteBackend> replica) {
  if (replica) replicas_.push_back(std::move(replica));
}

bool MirrorBackend::save_all(const std::vector<Note>& notes, std::string& msg) {
  bool ok = true;
  std::string errors;
  auto attempt = [&](INoteBackend& b) {
    std::string m;
    if (b.save_all(notes, m)) return;
    ok = false;
    if (!errors.empty()) errors += "; ";
    errors += b.describe() + ": " + m;
  };
  if (primary_) attempt(*primary_);
  for (auto& r : replicas_) attempt(*r);
  if (!ok) { msg = errors; return false; }
  msg = "saved " + std::to_string(notes.size()) + " notes to " + std::to_string(1 + replicas_.size()) + " targets";
  return true;
}

bool MirrorBackend::load_all(std::vector<Note>& out, std::string& msg) {
  if (!primary_) { out.clear(); msg = "mirror has no primary"; return false; }
  return primary_->load_all(out, msg);
}

std::string MirrorBackend::describe() const {
  std::string s = primary_ ? primary_->describe() : std::string("<none>");
  for (const auto& r : replicas_) s += " + " + r->describe();
  return s;
}
