#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace {
class ReadFd {
public:
  explicit ReadFd(const std::filesystem::path& p) : fd_(::open(p.string().c_str(), O_RDONLY)) {}
  ReadFd(const ReadFd&) = delete;
  ReadFd& operator=(const ReadFd&) = delete;
  ~ReadFd() { if (fd_ >= 0) ::close(fd_); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
private:
  int fd_;
};

class Mapping {
public:
  Mapping(void* mem, size_t n) : mem_(mem), n_(n) {}
  Mapping(const Mapping&) = delete;
  Mapping& operator=(const Mapping&) = delete;
  ~Mapping() { if (mem_ != MAP_FAILED) ::munmap(mem_, n_); }
  bool valid() const { return mem_ != MAP_FAILED; }
  const char* data() const { return static_cast<const char*>(mem_); }
private:
  void* mem_;
  size_t n_;
};

void push_line(std::vector<std::string>& out, const char* data, size_t start, size_t end) {
  if (end > start && data[end - 1] == '\r') end--;
  out.emplace_back(data + start, end - start);
}
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  ReadFd fd(path);
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { out_lines.emplace_back(""); msg = std::string("opened file: ") + path.string(); return true; }
  Mapping map(::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0), n);
  if (!map.valid()) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = map.data();
  (void)::madvise(const_cast<char*>(data), n, MADV_SEQUENTIAL);

  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') {
      push_line(out_lines, data, start, i);
      start = i + 1;
    }
  }
  push_line(out_lines, data, start, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}
