#include "cli.hpp"

#include <iostream>

int main(int argc, char* argv[])
{
    return Mtree::Cli::run(argc, argv, std::cout);
}
