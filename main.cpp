#include "cli_options.hpp"
#include "mirage_commands.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
    try {
        mirage::CliParser cli;
        cli.parse(argc, argv);
        return mirage::runCommand(cli);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return mirage::EXIT_CODE_RUNTIME;
    }
}
