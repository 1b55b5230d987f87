#pragma once
/*
 * SlideLoader
 *
 * Purpose: collect slide documents from a directory in presentation order.
 * Ordering: regular files with the given extension, sorted by file name (byte-wise).
 */
#include <filesystem>
#include <string>
#include <vector>
#include "deck.hpp"

bool load_slide_sources(const std::filesystem::path& dir,
                        const std::string& extension,
                        std::vector<SlideSource>& out,
                        std::string& msg);
