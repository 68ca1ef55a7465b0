#include "note_store.hpp"
#include "log.hpp"
#include "memory_backend.hpp"
#include <cassert>
#include <limits>
#include <set>
#include <string>

using namespace std::chrono;

namespace {
// fails every save once armed; loads whatever it was seeded with
class FlakyBackend : public INoteBackend {
public:
  bool save_all(const std::vector<Note>& notes, std::string& msg) override {
    ++attempts;
    if (failing) { msg = "device unplugged"; return false; }
    saved = notes;
    return true;
  }
  bool load_all(std::vector<Note>& out, std::string& msg) override {
    if (load_error) { msg = "permission denied"; return false; }
    out = seed;
    return true;
  }
  std::string describe() const override { return "flaky"; }

  bool failing = false;
  bool load_error = false;
  int attempts = 0;
  std::vector<Note> seed;
  std::vector<Note> saved;
};

// a clock that never moves
Timestamp frozen() { return Timestamp(seconds(1700000000)); }

Note seeded(NoteId id, long long updated_s) {
  Note n;
  n.id = id;
  n.title = "seed " + std::to_string(id);
  n.created_at = Timestamp(seconds(updated_s - 10));
  n.updated_at = Timestamp(seconds(updated_s));
  return n;
}
}

static void scenarios() {
  auto be = std::make_unique<MemoryBackend>();
  MemoryBackend* mem = be.get();
  NoteStore store(std::move(be));
  std::string msg;
  assert(store.init(msg));
  assert(store.ready() && store.persistent());

  Note a;
  assert(store.create("Shopping List", "- milk", a, msg));
  auto all = store.list();
  assert(all.size() == 1);
  assert(all[0].title == "Shopping List" && all[0].content == "- milk");
  assert(all[0].created_at == all[0].updated_at);
  assert(all[0].created_at != Timestamp{});
  assert(mem->notes() == all);

  Note b;
  assert(store.create("A", "x", b, msg));
  assert(store.update(b.id, "B", "y", msg));
  auto got = store.get(b.id);
  assert(got && got->title == "B" && got->content == "y");
  assert(got->updated_at > got->created_at);
  assert(got->created_at == b.created_at);

  Note c;
  assert(store.create("C", "", c, msg));
  assert(store.update(a.id, "Shopping List v2", "- milk\n- eggs", msg));
  all = store.list();
  assert(all.size() == 3);
  assert(all[0].title == "Shopping List v2");
  assert(all[1].id == c.id && all[2].id == b.id);
  assert(mem->notes() == all);
}

static void ids_and_ordering() {
  NoteStore store(std::make_unique<MemoryBackend>());
  std::string msg;
  assert(store.init(msg));
  store.set_clock(frozen);

  std::set<NoteId> ids;
  Timestamp prev{};
  for (int i = 0; i < 20; ++i) {
    Note n;
    assert(store.create("n" + std::to_string(i), "", n, msg));
    assert(n.id > 0);
    assert(ids.insert(n.id).second);
    // strictly increasing even though the clock is frozen
    assert(n.created_at > prev);
    prev = n.created_at;
  }
  assert(store.size() == 20);
  auto all = store.list();
  for (size_t i = 1; i < all.size(); ++i) assert(all[i - 1].updated_at > all[i].updated_at);
  assert(all.front().title == "n19");

  // deleted ids are not handed out again
  NoteId last = all.front().id;
  assert(store.remove(last, msg));
  Note fresh;
  assert(store.create("fresh", "", fresh, msg));
  assert(fresh.id != last);
  assert(!store.contains(last));
  assert(!store.get(last));
}

static void absent_ids() {
  auto be = std::make_unique<MemoryBackend>();
  MemoryBackend* mem = be.get();
  NoteStore store(std::move(be));
  std::string msg;
  assert(store.init(msg));
  Note n;
  assert(store.create("keep", "", n, msg));
  int saves = mem->save_count();

  assert(store.update(999, "x", "y", msg));
  assert(store.remove(999, msg));
  assert(mem->save_count() == saves);
  assert(store.size() == 1 && store.get(n.id)->title == "keep");

  // delete twice: second call is a no-op
  assert(store.remove(n.id, msg));
  assert(store.remove(n.id, msg));
  assert(store.size() == 0);
  assert(mem->save_count() == saves + 1);
  assert(mem->notes().empty());
}

static void soft_sync() {
  auto be = std::make_unique<FlakyBackend>();
  FlakyBackend* flaky = be.get();
  NoteStore store(std::move(be));
  std::string msg;
  assert(store.init(msg));
  assert(store.policy() == SyncPolicy::Soft);

  flaky->failing = true;
  Note n;
  assert(store.create("offline", "", n, msg));
  assert(store.size() == 1);
  assert(store.sync_failures() == 1);
  assert(store.last_sync_error() == "device unplugged");

  assert(store.update(n.id, "still offline", "", msg));
  assert(store.get(n.id)->title == "still offline");
  assert(store.sync_failures() == 2);

  // the next good save carries everything and clears the error
  flaky->failing = false;
  Note m;
  assert(store.create("online", "", m, msg));
  assert(store.last_sync_error().empty());
  assert(flaky->saved.size() == 2);
}

static void hard_sync() {
  auto be = std::make_unique<FlakyBackend>();
  FlakyBackend* flaky = be.get();
  NoteStore store(std::move(be), SyncPolicy::Hard);
  std::string msg;
  assert(store.init(msg));
  Note a, b;
  assert(store.create("a", "1", a, msg));
  assert(store.create("b", "2", b, msg));
  auto before = store.list();

  flaky->failing = true;
  Note c;
  assert(!store.create("c", "3", c, msg));
  assert(msg.find("device unplugged") != std::string::npos);
  assert(store.list() == before);

  assert(!store.update(a.id, "a2", "changed", msg));
  assert(store.list() == before);

  assert(!store.remove(b.id, msg));
  assert(store.list() == before);
  assert(store.sync_failures() == 3);

  // a rolled back create does not burn its id
  flaky->failing = false;
  assert(store.create("c", "3", c, msg));
  assert(c.id == b.id + 1);
}

static void without_backend() {
  NoteStore store(nullptr);
  std::string msg;
  Note n;
  assert(!store.create("early", "", n, msg));
  assert(store.init(msg));
  assert(!store.persistent());
  assert(store.create("ephemeral", "", n, msg));
  assert(store.update(n.id, "changed", "", msg));
  assert(store.list().size() == 1);
  assert(store.sync_failures() == 0);
}

static void loading() {
  auto be = std::make_unique<FlakyBackend>();
  be->seed = {seeded(4, 100), seeded(9, 300), seeded(2, 200)};
  NoteStore store(std::move(be));
  std::string msg;
  assert(store.init(msg));
  assert(store.size() == 3);
  auto all = store.list();
  assert(all[0].id == 9 && all[1].id == 2 && all[2].id == 4);

  // ids continue after the largest loaded id; stamps never go backwards
  store.set_clock([] { return Timestamp(seconds(1)); });
  Note n;
  assert(store.create("new", "", n, msg));
  assert(n.id == 10);
  assert(n.created_at > Timestamp(seconds(300)));
  assert(store.list().front().id == 10);

  auto broken = std::make_unique<FlakyBackend>();
  broken->load_error = true;
  NoteStore failed(std::move(broken));
  assert(!failed.init(msg));
  assert(msg.find("permission denied") != std::string::npos);
  assert(!failed.ready());
  assert(!failed.create("x", "", n, msg));

  auto dup = std::make_unique<FlakyBackend>();
  dup->seed = {seeded(1, 100), seeded(1, 200)};
  NoteStore dupstore(std::move(dup));
  assert(!dupstore.init(msg));
}

static void id_exhaustion() {
  const NoteId top = std::numeric_limits<NoteId>::max();
  std::string msg;

  // a loaded maximum id cannot be continued
  auto full = std::make_unique<FlakyBackend>();
  full->seed = {seeded(3, 100), seeded(top, 200)};
  NoteStore capped(std::move(full));
  assert(!capped.init(msg));
  assert(msg.find(std::to_string(top)) != std::string::npos);
  assert(!capped.ready() && capped.size() == 0);

  // the last id below the maximum is still loadable, but nothing follows it
  auto near = std::make_unique<FlakyBackend>();
  FlakyBackend* raw = near.get();
  near->seed = {seeded(top - 1, 100)};
  NoteStore store(std::move(near));
  assert(store.init(msg));
  Note n;
  assert(!store.create("one more", "", n, msg));
  assert(msg == "note ids exhausted");
  assert(store.size() == 1);
  assert(raw->attempts == 0);
}

int main() {
  log_disable();
  scenarios();
  ids_and_ordering();
  absent_ids();
  soft_sync();
  hard_sync();
  without_backend();
  loading();
  id_exhaustion();
  return 0;
}
