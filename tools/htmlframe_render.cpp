#include <cstdlib>
#include <iostream>

#include "cli/RenderCli.hpp"

int main(int argc, char** argv) {
    auto options_opt = HF::Cli::ParseRenderCliArguments(argc, argv);
    if (!options_opt) {
        HF::Cli::PrintRenderCliUsage(std::cerr);
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        HF::Cli::PrintRenderCliUsage(std::cout);
        return EXIT_SUCCESS;
    }

    return HF::Cli::RunRenderCli(options, std::cout) == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
