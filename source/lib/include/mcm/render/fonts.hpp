#pragma once

#include <chrono>
#include <cstddef>

#include <mcm/util.hpp>

// Registers every font file in the folder with Qt, returns how many were added
size_t LoadFonts(const fs::path& font_dir, std::chrono::milliseconds timeout);
