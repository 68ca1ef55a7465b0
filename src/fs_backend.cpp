#include "fs_backend.hpp"
#include "file_reader.hpp"
#include "json_codec.hpp"
#include "posix_fd.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>

std::unique_ptr<FileSystemBackend> FileSystemBackend::create(const std::filesystem::path& path, std::string& msg) {
  if (path.empty()) { msg = "notes path is empty"; return nullptr; }
  std::filesystem::path dir = path.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) { msg = std::string("failed to create directory ") + dir.string() + ": " + ec.message(); return nullptr; }
  }
  return std::unique_ptr<FileSystemBackend>(new FileSystemBackend(path));
}

std::string FileSystemBackend::describe() const { return path_.string(); }

static bool write_all(int fd, const char* p, size_t len) {
  while (len > 0) {
    ssize_t w = ::write(fd, p, len);
    if (w < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    p += w;
    len -= static_cast<size_t>(w);
  }
  return true;
}

bool FileSystemBackend::save_all(const std::vector<Note>& notes, std::string& msg) {
  std::string data = encode_notes(notes);
  std::filesystem::path tmp = path_;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    int err = errno;
    msg = std::string("failed to write file: ") + tmp.string() + ": " + std::strerror(err);
    return false;
  }
  auto fail = [&](const char* what) {
    msg = std::string("failed to write file: ") + tmp.string() + ": " + what;
    ufd.reset();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return false;
  };
  if (!write_all(ufd.get(), data.data(), data.size())) return fail(std::strerror(errno));
  if (!ufd.sync_data()) return fail(std::strerror(errno));
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    msg = std::string("failed to write file: ") + path_.string() + ": " + ec.message();
    std::filesystem::remove(tmp, ec);
    return false;
  }
  msg = "saved " + std::to_string(notes.size()) + " notes to " + path_.string();
  return true;
}

bool FileSystemBackend::load_all(std::vector<Note>& out, std::string& msg) {
  out.clear();
  std::string data;
  switch (mmap_read_file(path_, data, msg)) {
    case ReadStatus::Missing:
      msg = "no notes file yet: " + path_.string();
      return true;
    case ReadStatus::Failed:
      msg = "failed to read file: " + msg;
      return false;
    case ReadStatus::Ok:
      break;
  }
  if (!decode_notes(data, out, msg)) {
    msg = path_.string() + ": " + msg;
    return false;
  }
  msg = "loaded " + std::to_string(out.size()) + " notes from " + path_.string();
  return true;
}
