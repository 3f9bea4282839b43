#ifndef MIRAGE_COMMANDS_HPP
#define MIRAGE_COMMANDS_HPP

#include "cli_options.hpp"

// mirage make / extract / capacity
namespace mirage {

    // Process exit codes
    constexpr int EXIT_CODE_OK = 0;
    constexpr int EXIT_CODE_USAGE = 1;
    constexpr int EXIT_CODE_RUNTIME = 2;

    void printUsage();

    int runMake(const CliParser& cli);

    // Prints the payload. With --expect TEXT also prints the bit error rate
    // against TEXT.
    int runExtract(const CliParser& cli);

    int runCapacity(const CliParser& cli);

    // Dispatch on cli.command(). Unknown commands are usage errors, an empty
    // command or `help` prints usage and succeeds.
    int runCommand(const CliParser& cli);

}

#endif // MIRAGE_COMMANDS_HPP
