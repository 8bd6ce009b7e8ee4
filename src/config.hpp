#pragma once

#include <filesystem>
#include <optional>

struct Config {
    std::filesystem::path input;
    std::optional<std::filesystem::path> pattern; // MONSTER, replaces SEA_MONSTER
    unsigned verbose{ 1 }; // V

    // input from the command line, the rest from the environment
    static Config load(const char *input);
};
