#include <iostream>

#include "cli/cli.hpp"

int main(int argc, char* argv[])
{
    return Rektor::Cli::run(argc, argv, std::cout, std::cerr);
}
