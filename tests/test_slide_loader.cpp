#include "slide_loader.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

static void write_file(const fs::path& p, const std::string& text) { std::ofstream(p) << text; }

static void test_sorted_by_name() {
  fs::path dir = fs::temp_directory_path() / ("mslide_slides_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir / "01-sub.md");
  write_file(dir / "02-b.md", "# B\n");
  write_file(dir / "01-a.md", "# A\n");
  write_file(dir / "10-c.md", "# C\n");
  write_file(dir / "notes.txt", "not a slide\n");

  std::vector<SlideSource> out;
  std::string msg;
  assert(load_slide_sources(dir, ".md", out, msg));
  assert(out.size() == 3);
  assert(out[0].name == "01-a.md");
  assert(out[1].name == "02-b.md");
  assert(out[2].name == "10-c.md");
  assert(out[0].text == "# A\n");

  assert(load_slide_sources(dir, ".txt", out, msg));
  assert(out.size() == 1 && out[0].name == "notes.txt");

  fs::remove_all(dir);
}

static void test_empty_and_missing() {
  fs::path dir = fs::temp_directory_path() / ("mslide_empty_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  std::vector<SlideSource> out;
  std::string msg;
  assert(load_slide_sources(dir, ".md", out, msg));
  assert(out.empty());
  fs::remove_all(dir);

  assert(!load_slide_sources(dir, ".md", out, msg));
  assert(msg.find("not found") != std::string::npos);
}

int main() {
  test_sorted_by_name();
  test_empty_and_missing();
  return 0;
}
