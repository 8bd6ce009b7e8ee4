#pragma once

// jigsaw <tiles-file>
// 0 solved, 1 usage or input error, 2 no arrangement
[[nodiscard]] int run(int argc, char *argv[]);
