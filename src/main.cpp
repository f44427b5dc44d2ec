#include "sigchain/cli.hpp"

int main(int argc, char *argv[])
{
    return sigchain::cli::run(argc, argv);
}
