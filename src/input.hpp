#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "Image.hpp"
#include "Tile.hpp"

// "Tile <id>:" followed by EDGE_LEN rows of '#'/'.', records separated by blank lines
[[nodiscard]] std::vector<Tile> parse_tiles(std::string_view sv);

[[nodiscard]] std::vector<Tile> load_tiles(const std::filesystem::path &path);

[[nodiscard]] Image load_pattern(const std::filesystem::path &path);
