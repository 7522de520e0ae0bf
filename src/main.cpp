#include "cli.hpp"

#include <iostream>

int main(int argc, char** argv)
{
   return intexpr::cli::main(argc, argv, std::cin, std::cout, std::cerr);
}
