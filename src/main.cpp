#include "swi/cli.hpp"

int main(int argc, char** argv) {
    return swi::RunCli(argc, argv);
}
