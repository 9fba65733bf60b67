//          Copyright Nick G 2020.
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE or copy at
//          https://www.boost.org/LICENSE_1_0.txt)
#include <iostream>
#include <CLI/CLI.hpp>
#include "App.hpp"
#include "Logging.hpp"
#include "Options.hpp"

int main(int argc, char ** argv)
{
    setupLogging();

    CLI::App app{"Prints a one line summary of a git working tree for use in a shell prompt"};
    Options options;
    addOptions(app, options);
    CLI11_PARSE(app, argc, argv);

    printPrompt(options, std::cout);

    return 0;
}
