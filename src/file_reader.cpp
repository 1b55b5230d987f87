#include "file_reader.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include "posix_fd.hpp"

bool mmap_read_text(const std::filesystem::path& path,
                    std::string& out,
                    std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened ") + path.string(); return true; }
  MappedRegion map(fd.get(), n);
  if (!map.valid()) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  (void)::madvise(const_cast<char*>(map.data()), n, MADV_SEQUENTIAL);
  out.assign(map.data(), n);
  msg = std::string("opened file: ") + path.string();
  return true;
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  size_t n = text.size();
  for (size_t i = 0; i < n; ++i) {
    if (text[i] == '\n') {
      size_t end = i;
      if (end > start && text[end - 1] == '\r') end--;
      lines.emplace_back(text.substr(start, end - start));
      start = i + 1;
    }
  }
  if (start < n) {
    size_t end = n;
    if (end > start && text[end - 1] == '\r') end--;
    lines.emplace_back(text.substr(start, end - start));
  }
  return lines;
}
