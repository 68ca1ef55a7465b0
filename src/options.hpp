#pragma once
/*
 * Options
 *
 * Purpose: startup configuration; built-in defaults, then ~/.termnotesrc, then the command line.
 * rc: one command per line, dispatched through CommandRegistry ("set file <path>", ...).
 * Errors: rc problems become diagnostics and never stop startup; bad CLI input does.
 */
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "backend.hpp"
#include "cmd_registry.hpp"
#include "note_store.hpp"

struct Options {
  std::filesystem::path home;
  std::filesystem::path notes_path;
  std::optional<std::filesystem::path> backup_path;
  std::optional<std::filesystem::path> log_path; // unset: next to the notes file
  bool log_enabled = true;
  SyncPolicy sync = SyncPolicy::Soft;
  bool mouse = true;
  bool color = true;
  bool ephemeral = false;
};

// needs $HOME; fails with msg when it is unset or empty
bool default_options(Options& opts, std::string& msg);

// "~" and "~/x" are resolved against home; anything else is returned as is
std::filesystem::path expand_home(const std::string& text, const std::filesystem::path& home);

void register_option_commands(CommandRegistry& registry, Options& opts);

// one rc line; comments and blank lines succeed without doing anything
bool run_rc_line(const CommandRegistry& registry, const std::string& line, std::string& msg);

// a missing rc file is not an error; diagnostics carry "path:line: reason"
bool load_rc(const std::filesystem::path& path, Options& opts, std::vector<std::string>& diagnostics);

std::filesystem::path log_file_for(const Options& opts);

struct CliArgs {
  std::optional<std::filesystem::path> file;
  std::optional<std::filesystem::path> rc;
  bool memory = false;
  bool strict_sync = false;
};

enum class ParseResult { Run, Help, Error };

ParseResult parse_args(int argc, char** argv, CliArgs& out, std::string& msg);
void apply_args(const CliArgs& args, Options& opts);
std::string usage(const std::string& prog);

// null with ephemeral set (msg empty) or on failure (msg set)
std::unique_ptr<INoteBackend> make_backend(const Options& opts, std::string& msg);
