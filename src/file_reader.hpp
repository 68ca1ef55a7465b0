#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file via mmap; optionally split into lines (CRLF normalized).
 * Usage: mmap_read_file(path, out, msg); Missing is reported apart from other failures.
 */
#include <vector>
#include <string>
#include <filesystem>

enum class ReadStatus { Ok, Missing, Failed };

ReadStatus mmap_read_file(const std::filesystem::path& path,
                          std::string& out,
                          std::string& msg);

ReadStatus mmap_readlines(const std::filesystem::path& path,
                          std::vector<std::string>& out_lines,
                          std::string& msg);
