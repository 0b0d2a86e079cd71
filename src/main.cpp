#include <iostream>
#include <string>
#include <core/constants.hpp>
#include "cli/tplreg_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner(TPLREG_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    tplreg check "
              << theme::color::RESET << theme::color::BROWN << "[path]"
              << theme::color::RESET << theme::color::DIM
              << "     Register templates, resolve views, report unused" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tplreg list "
              << theme::color::RESET << theme::color::BROWN << "[path]"
              << theme::color::RESET << theme::color::DIM
              << "      List registered templates" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    path is a project directory containing tplreg.yaml, or the manifest itself\n"
              << "    tplreg --version        Show version\n"
              << "    tplreg --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        TplregCLI cli;

        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        std::string path = argc >= 3 ? argv[2] : "";

        if (cmd == "--version") {
            std::cout << theme::color::BLUE << theme::color::BOLD << "tplreg"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << TPLREG_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "check") {
            return cli.run_check(path);
        } else if (cmd == "list") {
            return cli.run_list(path);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
