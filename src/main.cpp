#include "cli.hpp"

int main(int argc, char* argv[]) {
    return cdihook::cli_run(argc, argv);
}
