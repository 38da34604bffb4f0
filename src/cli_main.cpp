#include <iostream>
#include <string>
#include <vector>
#include "cli.hpp"

// Headless build: commands only
int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return cli::run_main(args, std::cin, std::cout, std::cerr);
}
