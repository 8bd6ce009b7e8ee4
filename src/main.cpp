#include <mimalloc-new-delete.h>

#include "cli.hpp"

int main(int argc, char *argv[]) {
    return run(argc, argv);
}
