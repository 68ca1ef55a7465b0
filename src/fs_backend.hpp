#pragma once
/*
 * FileSystemBackend
 *
 * Purpose: INoteBackend over one JSON file.
 * Feature: safe writes (write .tmp -> fdatasync -> rename); a missing file loads as empty.
 * Note: the parent directory is created by create(); failing that, no backend.
 */
#include <filesystem>
#include <memory>
#include "backend.hpp"

class FileSystemBackend : public INoteBackend {
public:
  static std::unique_ptr<FileSystemBackend> create(const std::filesystem::path& path, std::string& msg);

  bool save_all(const std::vector<Note>& notes, std::string& msg) override;
  bool load_all(std::vector<Note>& out, std::string& msg) override;
  std::string describe() const override;

private:
  explicit FileSystemBackend(std::filesystem::path path) : path_(std::move(path)) {}
  std::filesystem::path path_;
};
