#include "json_codec.hpp"
#include <cassert>
#include <string>
#include <vector>

using namespace std::chrono;

static Note make(NoteId id, const std::string& title, const std::string& content, long long created_s, long long updated_s) {
  Note n;
  n.id = id;
  n.title = title;
  n.content = content;
  n.created_at = Timestamp(seconds(created_s));
  n.updated_at = Timestamp(seconds(updated_s));
  return n;
}

static bool rejects(const std::string& text) {
  std::vector<Note> out;
  std::string msg;
  return !decode_notes(text, out, msg) && !msg.empty();
}

static const char* kRecord = R"("Title":"t","Content":"c","CreatedAt":"2024-01-01T00:00:00Z","UpdatedAt":"2024-01-02T00:00:00Z")";

int main() {
  std::vector<Note> out;
  std::string msg;

  assert(encode_notes({}) == "[]");
  assert(decode_notes("null", out, msg) && out.empty());
  assert(decode_notes("[]", out, msg) && out.empty());

  std::vector<Note> notes = {make(2, "Groceries", "- milk\n- \"eggs\"", 1700000000, 1700000100),
                             make(1, "Ideas", "", 1600000000, 1600000000)};
  std::string text = encode_notes(notes);
  size_t id = text.find("\"ID\"");
  size_t title = text.find("\"Title\"");
  size_t content = text.find("\"Content\"");
  size_t created = text.find("\"CreatedAt\"");
  size_t updated = text.find("\"UpdatedAt\"");
  assert(id != std::string::npos && id < title && title < content && content < created && created < updated);
  assert(text.find("\n  {") != std::string::npos);
  assert(decode_notes(text, out, msg));
  assert(out == notes);

  // files written by other tools: nanosecond stamps, offsets, lower-case keys
  std::string foreign = R"([{"id":7,"title":"a","content":"b",)"
                        R"("createdAt":"2024-01-15T10:30:45.123456789-05:00","updatedAt":"2024-01-15T15:30:46Z"}])";
  assert(decode_notes(foreign, out, msg));
  assert(out.size() == 1 && out[0].id == 7 && out[0].title == "a" && out[0].content == "b");
  assert(out[0].updated_at - out[0].created_at == nanoseconds(876543211));

  // invalid UTF-8 must still encode
  std::vector<Note> bad = {make(1, "\xff", "", 0, 0)};
  assert(decode_notes(encode_notes(bad), out, msg));
  assert(out[0].title == "\xEF\xBF\xBD");

  assert(rejects(""));
  assert(rejects("[{"));
  assert(rejects("{}"));
  assert(rejects("[1]"));
  assert(rejects(std::string("[{\"ID\":0,") + kRecord + "}]"));
  assert(rejects(std::string("[{\"ID\":\"1\",") + kRecord + "}]"));
  assert(rejects(std::string("[{\"ID\":1,") + kRecord + "},{\"ID\":1," + kRecord + "}]"));
  assert(rejects(R"([{"ID":1,"Content":"c","CreatedAt":"2024-01-01T00:00:00Z","UpdatedAt":"2024-01-01T00:00:00Z"}])"));
  assert(rejects(R"([{"ID":1,"Title":"t","Content":"c","CreatedAt":"2024-01-03T00:00:00Z","UpdatedAt":"2024-01-02T00:00:00Z"}])"));
  assert(rejects(R"([{"ID":1,"Title":"t","Content":"c","CreatedAt":"yesterday","UpdatedAt":"2024-01-02T00:00:00Z"}])"));

  // a failed decode leaves the output empty
  out = notes;
  assert(!decode_notes("[1]", out, msg));
  assert(out.empty());
  return 0;
}
