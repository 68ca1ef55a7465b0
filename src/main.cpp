#include "terminal.hpp"
#include "app.hpp"
#include "config.hpp"
#include "log.hpp"
#include "options.hpp"
#include <iostream>

int main(int argc, char** argv) {
  std::string prog = argc > 0 ? argv[0] : "termnotes";
  CliArgs args;
  std::string msg;
  switch (parse_args(argc, argv, args, msg)) {
    case ParseResult::Help: std::cout << usage(prog); return 0;
    case ParseResult::Error: std::cerr << prog << ": " << msg << "\n" << usage(prog); return 2;
    case ParseResult::Run: break;
  }

  log_to_stderr();
  Options opts;
  if (!default_options(opts, msg)) { std::cerr << "Error: " << msg << "\n"; return 1; }
  std::vector<std::string> diagnostics;
  bool rc_read = load_rc(args.rc ? *args.rc : opts.home / TERMNOTES_RC_FILE, opts, diagnostics);
  for (const auto& d : diagnostics) log_warn("config", d);
  if (!rc_read) log_warn("config", "rc file not applied, using defaults");
  apply_args(args, opts);

  auto backend = make_backend(opts, msg);
  if (!backend && !opts.ephemeral) { std::cerr << "Error: " << msg << "\n"; return 1; }
  NoteStore store(std::move(backend), opts.sync);
  if (!store.init(msg)) { std::cerr << "Error: " << msg << "\n"; return 1; }

  // curses owns the screen from here on; an ephemeral session writes nothing unless asked to
  if (opts.log_enabled && (!opts.ephemeral || opts.log_path)) {
    if (!log_to_file(log_file_for(opts))) std::cerr << "warning: cannot open log file " << log_file_for(opts) << "\n";
  } else {
    log_disable();
  }
  {
    Terminal term(opts.mouse);
    App app(store, opts.mouse, opts.color);
    app.run();
  }
  log_to_stderr();
  if (store.sync_failures() > 0) {
    std::cerr << "warning: " << store.sync_failures() << " save(s) failed; last error: " << store.last_sync_error() << "\n";
  }
  return 0;
}
