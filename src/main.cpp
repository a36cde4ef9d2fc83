#include "cli/cli.h"

int main(int argc, char* argv[]) {
    return cryptotrade::cli::runCli(argc, argv);
}
