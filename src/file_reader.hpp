#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file via mmap; split text into lines with CRLF normalized.
 * Usage: mmap_read_text(path, out, msg); returns false with msg on failure.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>

bool mmap_read_text(const std::filesystem::path& path,
                    std::string& out,
                    std::string& msg);

// Splits on '\n', dropping a trailing '\r' from each line. A final newline does
// not produce an extra empty line.
std::vector<std::string> split_lines(std::string_view text);
