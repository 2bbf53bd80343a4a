#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace {
// Owns the descriptor and, once mapped, the mapping; both released on scope exit.
struct MappedFile {
  int fd = -1;
  void* mem = MAP_FAILED;
  size_t len = 0;
  MappedFile() = default;
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  ~MappedFile() {
    if (mem != MAP_FAILED) ::munmap(mem, len);
    if (fd >= 0) ::close(fd);
  }
};
}

bool mmap_read_file(const std::filesystem::path& path, std::string& out, std::string& msg) {
  out.clear();
  MappedFile f;
  f.fd = ::open(path.string().c_str(), O_RDONLY);
  if (f.fd < 0) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(f.fd, &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened file: ") + path.string(); return true; }
  f.mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, f.fd, 0);
  if (f.mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  f.len = n;
  (void)::madvise(f.mem, n, MADV_SEQUENTIAL);
  out.assign(static_cast<const char*>(f.mem), n);
  msg = std::string("opened file: ") + path.string();
  return true;
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  std::string data;
  if (!mmap_read_file(path, data, msg)) return false;
  size_t start = 0;
  size_t n = data.size();
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
  return true;
}
