#include "json_codec.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_set>

using ordered_json = nlohmann::ordered_json;

std::string encode_notes(const std::vector<Note>& notes) {
  ordered_json arr = ordered_json::array();
  for (const auto& n : notes) {
    ordered_json obj;
    obj["ID"] = n.id;
    obj["Title"] = n.title;
    obj["Content"] = n.content;
    obj["CreatedAt"] = format_timestamp(n.created_at);
    obj["UpdatedAt"] = format_timestamp(n.updated_at);
    arr.push_back(std::move(obj));
  }
  // invalid UTF-8 must not make a save throw
  return arr.dump(2, ' ', false, ordered_json::error_handler_t::replace);
}

static bool iequals(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
           return std::tolower(x) == std::tolower(y);
         });
}

static const ordered_json* find_field(const ordered_json& obj, const std::string& name) {
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    if (iequals(it.key(), name)) return &it.value();
  }
  return nullptr;
}

static bool read_string(const ordered_json& obj, const char* name, size_t index, std::string& out, std::string& msg) {
  const ordered_json* v = find_field(obj, name);
  if (!v || !v->is_string()) {
    msg = "note #" + std::to_string(index) + ": field " + name + " missing or not a string";
    return false;
  }
  out = v->get<std::string>();
  return true;
}

static bool read_time(const ordered_json& obj, const char* name, size_t index, Timestamp& out, std::string& msg) {
  std::string text;
  if (!read_string(obj, name, index, text, msg)) return false;
  std::string why;
  if (!parse_timestamp(text, out, why)) {
    msg = "note #" + std::to_string(index) + ": " + why;
    return false;
  }
  return true;
}

bool decode_notes(const std::string& text, std::vector<Note>& out, std::string& msg) {
  out.clear();
  ordered_json root;
  try {
    root = ordered_json::parse(text);
  } catch (const ordered_json::parse_error& e) {
    msg = std::string("malformed notes file: ") + e.what();
    return false;
  }
  if (root.is_null()) return true;
  if (!root.is_array()) { msg = "malformed notes file: top level is not an array"; return false; }

  std::vector<Note> notes;
  notes.reserve(root.size());
  std::unordered_set<NoteId> seen;
  for (size_t i = 0; i < root.size(); ++i) {
    const ordered_json& obj = root[i];
    if (!obj.is_object()) { msg = "note #" + std::to_string(i) + ": not an object"; return false; }
    Note n;
    const ordered_json* id = find_field(obj, "ID");
    if (!id || !id->is_number_integer()) { msg = "note #" + std::to_string(i) + ": field ID missing or not an integer"; return false; }
    n.id = id->get<NoteId>();
    if (n.id <= 0) { msg = "note #" + std::to_string(i) + ": ID must be positive"; return false; }
    if (!seen.insert(n.id).second) { msg = "note #" + std::to_string(i) + ": duplicate ID " + std::to_string(n.id); return false; }
    if (!read_string(obj, "Title", i, n.title, msg)) return false;
    if (!read_string(obj, "Content", i, n.content, msg)) return false;
    if (!read_time(obj, "CreatedAt", i, n.created_at, msg)) return false;
    if (!read_time(obj, "UpdatedAt", i, n.updated_at, msg)) return false;
    if (n.created_at > n.updated_at) { msg = "note #" + std::to_string(i) + ": CreatedAt is after UpdatedAt"; return false; }
    notes.push_back(std::move(n));
  }
  out = std::move(notes);
  return true;
}
