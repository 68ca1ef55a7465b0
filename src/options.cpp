#include "options.hpp"
#include "config.hpp"
#include "file_reader.hpp"
#include "fs_backend.hpp"
#include "mirror_backend.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>

bool default_options(Options& opts, std::string& msg) {
  const char* home = std::getenv("HOME");
  if (!home || !*home) { msg = "HOME is not set; cannot locate the notes directory"; return false; }
  opts.home = home;
  opts.notes_path = opts.home / TERMNOTES_DIR_NAME / TERMNOTES_NOTES_FILE;
  return true;
}

std::filesystem::path expand_home(const std::string& text, const std::filesystem::path& home) {
  if (text == "~") return home;
  if (text.size() >= 2 && text[0] == '~' && text[1] == '/') return home / text.substr(2);
  return std::filesystem::path(text);
}

static bool parse_switch(const std::vector<std::string>& args, const char* name, bool& out, std::string& msg) {
  if (args.size() == 1 && args[0] == "on") { out = true; return true; }
  if (args.size() == 1 && args[0] == "off") { out = false; return true; }
  msg = std::string("set ") + name + ": use set " + name + " on|off";
  return false;
}

void register_option_commands(CommandRegistry& registry, Options& opts) {
  registry.register_command("set file", [&opts](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "set file: use set file <path>"; return false; }
    opts.notes_path = expand_home(args[0], opts.home);
    return true;
  });
  registry.register_command("set backup", [&opts](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "set backup: use set backup <path>|off"; return false; }
    if (args[0] == "off") opts.backup_path.reset();
    else opts.backup_path = expand_home(args[0], opts.home);
    return true;
  });
  registry.register_command("set sync", [&opts](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() == 1 && args[0] == "soft") { opts.sync = SyncPolicy::Soft; return true; }
    if (args.size() == 1 && args[0] == "hard") { opts.sync = SyncPolicy::Hard; return true; }
    msg = "set sync: use set sync soft|hard";
    return false;
  });
  registry.register_command("set mouse", [&opts](const std::vector<std::string>& args, std::string& msg) {
    return parse_switch(args, "mouse", opts.mouse, msg);
  });
  registry.register_command("set color", [&opts](const std::vector<std::string>& args, std::string& msg) {
    return parse_switch(args, "color", opts.color, msg);
  });
  registry.register_command("set log", [&opts](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "set log: use set log <path>|off"; return false; }
    if (args[0] == "off") { opts.log_enabled = false; return true; }
    opts.log_enabled = true;
    opts.log_path = expand_home(args[0], opts.home);
    return true;
  });
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

bool run_rc_line(const CommandRegistry& registry, const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());

  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    // "set name=value" and "set name value" are equivalent
    std::string name = args[0];
    std::vector<std::string> subargs;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      if (eq + 1 < name.size()) subargs.push_back(name.substr(eq + 1));
      name = name.substr(0, eq);
    }
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    return registry.execute("set " + name, subargs, msg);
  }
  return registry.execute(cmd, args, msg);
}

bool load_rc(const std::filesystem::path& path, Options& opts, std::vector<std::string>& diagnostics) {
  std::vector<std::string> lines; std::string msg;
  ReadStatus st = mmap_readlines(path, lines, msg);
  if (st == ReadStatus::Missing) return true;
  if (st == ReadStatus::Failed) { diagnostics.push_back(msg); return false; }
  CommandRegistry registry;
  register_option_commands(registry, opts);
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string err;
    if (!run_rc_line(registry, lines[i], err)) {
      diagnostics.push_back(path.string() + ":" + std::to_string(i + 1) + ": " + err);
    }
  }
  return true;
}

std::filesystem::path log_file_for(const Options& opts) {
  if (opts.log_path) return *opts.log_path;
  return opts.notes_path.parent_path() / TERMNOTES_LOG_FILE;
}

ParseResult parse_args(int argc, char** argv, CliArgs& out, std::string& msg) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&](std::optional<std::filesystem::path>& slot) {
      if (i + 1 >= argc) { msg = "option " + a + " needs a value"; return false; }
      slot = std::filesystem::path(argv[++i]);
      return true;
    };
    if (a == "-h" || a == "--help") return ParseResult::Help;
    if (a == "--memory") { out.memory = true; continue; }
    if (a == "--strict-sync") { out.strict_sync = true; continue; }
    if (a == "-f" || a == "--file") { if (!value(out.file)) return ParseResult::Error; continue; }
    if (a == "--rc") { if (!value(out.rc)) return ParseResult::Error; continue; }
    if (a.size() > 1 && a[0] == '-') { msg = "unknown option: " + a; return ParseResult::Error; }
    if (out.file) { msg = "more than one notes file given: " + a; return ParseResult::Error; }
    out.file = std::filesystem::path(a);
  }
  return ParseResult::Run;
}

void apply_args(const CliArgs& args, Options& opts) {
  if (args.file) opts.notes_path = expand_home(args.file->string(), opts.home);
  if (args.memory) opts.ephemeral = true;
  if (args.strict_sync) opts.sync = SyncPolicy::Hard;
}

std::string usage(const std::string& prog) {
  std::ostringstream os;
  os << "usage: " << prog << " [options] [notes-file]\n"
     << "  -f, --file PATH   notes file (default ~/" << TERMNOTES_DIR_NAME << "/" << TERMNOTES_NOTES_FILE << ")\n"
     << "      --memory      keep notes in memory only\n"
     << "      --strict-sync fail edits that cannot be saved\n"
     << "      --rc PATH     read settings from PATH instead of ~/" << TERMNOTES_RC_FILE << "\n"
     << "  -h, --help        show this help\n";
  return os.str();
}

std::unique_ptr<INoteBackend> make_backend(const Options& opts, std::string& msg) {
  msg.clear();
  if (opts.ephemeral) return nullptr;
  auto primary = FileSystemBackend::create(opts.notes_path, msg);
  if (!primary) return nullptr;
  if (!opts.backup_path) return primary;
  auto replica = FileSystemBackend::create(*opts.backup_path, msg);
  if (!replica) return nullptr;
  auto mirror = std::make_unique<MirrorBackend>(std::move(primary));
  mirror->add_replica(std::move(replica));
  return mirror;
}
