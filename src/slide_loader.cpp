#include "slide_loader.hpp"
#include <algorithm>
#include "file_reader.hpp"

bool load_slide_sources(const std::filesystem::path& dir,
                        const std::string& extension,
                        std::vector<SlideSource>& out,
                        std::string& msg) {
  out.clear();
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) { msg = "slides directory not found: " + dir.string(); return false; }
  std::vector<std::filesystem::path> files;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (it->path().extension().string() != extension) continue;
    files.push_back(it->path());
  }
  if (ec) { msg = "can not list " + dir.string() + ": " + ec.message(); return false; }
  std::sort(files.begin(), files.end(), [](const std::filesystem::path& a, const std::filesystem::path& b) {
    return a.filename().string() < b.filename().string();
  });
  out.reserve(files.size());
  for (const auto& f : files) {
    SlideSource src;
    src.name = f.filename().string();
    if (!mmap_read_text(f, src.text, msg)) return false;
    out.push_back(std::move(src));
  }
  msg = "found " + std::to_string(out.size()) + " slide file(s) in " + dir.string();
  return true;
}
