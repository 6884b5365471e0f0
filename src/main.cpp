#include <iostream>
#include <vector>
#include <string>
#include "cli/folio_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        FolioCLI cli(std::cout);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
