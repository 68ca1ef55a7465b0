#include "options.hpp"
#include "config.hpp"
#include "fs_backend.hpp"
#include "log.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static ParseResult parse(std::vector<std::string> words, CliArgs& out, std::string& msg) {
  words.insert(words.begin(), "termnotes");
  std::vector<char*> argv;
  for (auto& w : words) argv.push_back(w.data());
  argv.push_back(nullptr);
  return parse_args(static_cast<int>(words.size()), argv.data(), out, msg);
}

static void defaults(const fs::path& home) {
  std::string msg;
  Options opts;
  ::unsetenv("HOME");
  assert(!default_options(opts, msg));
  assert(!msg.empty());

  ::setenv("HOME", home.c_str(), 1);
  assert(default_options(opts, msg));
  assert(opts.notes_path == home / ".termnotes" / "notes.json");
  assert(opts.sync == SyncPolicy::Soft && opts.mouse && opts.color && !opts.ephemeral);
  assert(log_file_for(opts) == home / ".termnotes" / TERMNOTES_LOG_FILE);

  assert(expand_home("~", home) == home);
  assert(expand_home("~/x/y.json", home) == home / "x/y.json");
  assert(expand_home("/abs/n.json", home) == fs::path("/abs/n.json"));
  assert(expand_home("~other", home) == fs::path("~other"));
}

static void rc_file(const fs::path& home) {
  fs::path rc = home / "termnotesrc";
  {
    std::ofstream f(rc);
    f << "# comment\n"
      << "\" vim style comment\n"
      << "\n"
      << "set file ~/work/notes.json\n"
      << ":set sync=hard\n"
      << "set mouse off\n"
      << "set color maybe\n"
      << "set backup /tmp/mirror.json\n"
      << "set log off\n"
      << "bogus command\n";
  }
  Options opts;
  std::string msg;
  assert(default_options(opts, msg));
  std::vector<std::string> diags;
  assert(load_rc(rc, opts, diags));
  assert(opts.notes_path == home / "work" / "notes.json");
  assert(opts.sync == SyncPolicy::Hard);
  assert(!opts.mouse);
  assert(opts.color);
  assert(opts.backup_path && *opts.backup_path == fs::path("/tmp/mirror.json"));
  assert(!opts.log_enabled);
  assert(diags.size() == 2);
  assert(diags[0].find(":7:") != std::string::npos && diags[0].find("set color") != std::string::npos);
  assert(diags[1].find(":10:") != std::string::npos && diags[1].find("unknown command: bogus") != std::string::npos);

  Options untouched;
  assert(default_options(untouched, msg));
  diags.clear();
  assert(load_rc(home / "missing-rc", untouched, diags));
  assert(diags.empty());

  CommandRegistry registry;
  register_option_commands(registry, untouched);
  assert(registry.contains("set log"));
  assert(run_rc_line(registry, "set log ~/n.log", msg));
  assert(untouched.log_path && *untouched.log_path == home / "n.log");
  assert(log_file_for(untouched) == home / "n.log");
  assert(!run_rc_line(registry, "set sync", msg));
  assert(run_rc_line(registry, "   // slash comment", msg));
}

static void command_line(const fs::path& home) {
  std::string msg;
  CliArgs args;
  assert(parse({}, args, msg) == ParseResult::Run);
  assert(!args.file && !args.memory && !args.strict_sync);

  args = CliArgs{};
  assert(parse({"--strict-sync", "--rc", "/etc/tn.rc", "~/n.json"}, args, msg) == ParseResult::Run);
  assert(args.strict_sync && args.rc && *args.rc == fs::path("/etc/tn.rc"));
  Options opts;
  assert(default_options(opts, msg));
  apply_args(args, opts);
  assert(opts.notes_path == home / "n.json");
  assert(opts.sync == SyncPolicy::Hard);

  args = CliArgs{};
  assert(parse({"-f", "a.json", "--memory"}, args, msg) == ParseResult::Run);
  assert(args.file == fs::path("a.json") && args.memory);

  args = CliArgs{};
  assert(parse({"--help"}, args, msg) == ParseResult::Help);
  assert(parse({"-x"}, args, msg) == ParseResult::Error);
  assert(msg.find("-x") != std::string::npos);
  args = CliArgs{};
  assert(parse({"--file"}, args, msg) == ParseResult::Error);
  args = CliArgs{};
  assert(parse({"a.json", "b.json"}, args, msg) == ParseResult::Error);
  assert(usage("termnotes").find("--memory") != std::string::npos);
}

static void backends(const fs::path& home) {
  std::string msg;
  Options opts;
  assert(default_options(opts, msg));
  opts.ephemeral = true;
  assert(!make_backend(opts, msg));
  assert(msg.empty());

  opts.ephemeral = false;
  opts.notes_path = home / "data" / "notes.json";
  auto plain = make_backend(opts, msg);
  assert(plain && plain->describe() == opts.notes_path.string());

  opts.backup_path = home / "mirror" / "notes.json";
  auto mirrored = make_backend(opts, msg);
  assert(mirrored);
  assert(mirrored->describe().find(" + ") != std::string::npos);
  assert(mirrored->save_all({}, msg));
  assert(fs::exists(home / "mirror" / "notes.json"));

  std::ofstream(home / "file") << "x";
  opts.notes_path = home / "file" / "notes.json";
  assert(!make_backend(opts, msg));
  assert(!msg.empty());
}

int main() {
  log_disable();
  fs::path home = fs::temp_directory_path() / ("termnotes_options_" + std::to_string(::getpid()));
  fs::remove_all(home);
  fs::create_directories(home);
  defaults(home);
  rc_file(home);
  command_line(home);
  backends(home);
  fs::remove_all(home);
  return 0;
}
