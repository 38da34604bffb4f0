#include <iostream>
#include <string>
#include <vector>
#include "cli.hpp"
#include "ui/main_window.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // No command → launch GUI
    return cli::run_main(args, std::cin, std::cout, std::cerr,
                         [argc, argv](const std::string& config_path) {
                             return ui::run_gui(argc, argv, config_path);
                         });
}
