#pragma once

#include <cstdint>
#include <string_view>

#include "Arrangement.hpp"
#include "Image.hpp"

constexpr inline std::string_view SEA_MONSTER =
    "                  # \n"
    "#    ##    ##    ###\n"
    " #  #  #  #  #  #   \n";

// product of the ids in the corners; must be complete()
[[nodiscard]] uint64_t corner_product(const Arrangement &arrangement);

// assembles the image, then marks every occurrence of pattern in it
[[nodiscard]] MonsterReport water_roughness(const Arrangement &arrangement, const Image &pattern);
