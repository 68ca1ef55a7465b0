#include "mirror_backend.hpp"
#include "memory_backend.hpp"
#include <cassert>
#include <string>

namespace {
class BrokenBackend : public INoteBackend {
public:
  bool save_all(const std::vector<Note>&, std::string& msg) override { ++attempts; msg = "disk full"; return false; }
  bool load_all(std::vector<Note>& out, std::string& msg) override { out.clear(); msg = "unreadable"; return false; }
  std::string describe() const override { return "broken"; }
  int attempts = 0;
};

Note make(NoteId id) {
  Note n;
  n.id = id;
  n.title = "n" + std::to_string(id);
  return n;
}
}

int main() {
  std::string msg;
  std::vector<Note> out;

  auto primary = std::make_unique<MemoryBackend>(std::vector<Note>{make(1)});
  auto replica = std::make_unique<MemoryBackend>();
  MemoryBackend* p = primary.get();
  MemoryBackend* r = replica.get();
  MirrorBackend mirror(std::move(primary));
  mirror.add_replica(std::move(replica));
  mirror.add_replica(nullptr);
  assert(mirror.replica_count() == 1);
  assert(mirror.describe() == "memory + memory");

  // loads come from the primary only
  assert(mirror.load_all(out, msg));
  assert(out.size() == 1 && out[0].id == 1);

  std::vector<Note> notes = {make(2), make(1)};
  assert(mirror.save_all(notes, msg));
  assert(p->notes() == notes);
  assert(r->notes() == notes);

  // a failing replica fails the save but every target is still written
  auto broken = std::make_unique<BrokenBackend>();
  BrokenBackend* b = broken.get();
  mirror.add_replica(std::move(broken));
  auto healthy = std::make_unique<MemoryBackend>();
  MemoryBackend* h = healthy.get();
  mirror.add_replica(std::move(healthy));
  assert(!mirror.save_all({make(5)}, msg));
  assert(msg.find("broken: disk full") != std::string::npos);
  assert(b->attempts == 1);
  assert(p->notes().size() == 1 && p->notes()[0].id == 5);
  assert(h->save_count() == 1);

  MirrorBackend failing(std::make_unique<BrokenBackend>());
  assert(!failing.load_all(out, msg));
  assert(msg == "unreadable");
  return 0;
}
