#include "anchor/cli.hpp"

int main(int argc, char *argv[])
{
    return anchor::cli::run(argc, argv);
}
