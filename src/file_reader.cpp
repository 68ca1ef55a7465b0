#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

ReadStatus mmap_read_file(const std::filesystem::path& path,
                          std::string& out,
                          std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) {
    int err = errno;
    if (err == ENOENT) { msg = std::string("no such file: ") + path.string(); return ReadStatus::Missing; }
    msg = std::string("can not open file: ") + path.string() + ": " + std::strerror(err);
    return ReadStatus::Failed;
  }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return ReadStatus::Failed; }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return ReadStatus::Failed; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("read file: ") + path.string(); return ReadStatus::Ok; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return ReadStatus::Failed; }
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  out.assign(static_cast<const char*>(mem), n);
  ::munmap(mem, n);
  msg = std::string("read file: ") + path.string();
  return ReadStatus::Ok;
}

ReadStatus mmap_readlines(const std::filesystem::path& path,
                          std::vector<std::string>& out_lines,
                          std::string& msg) {
  out_lines.clear();
  std::string data;
  ReadStatus st = mmap_read_file(path, data, msg);
  if (st != ReadStatus::Ok) return st;
  size_t n = data.size();
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      out_lines.emplace_back(data, start, end - start);
      start = i + 1;
    }
  }
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data, start, end - start);
  }
  return ReadStatus::Ok;
}
