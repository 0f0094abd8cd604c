
#include "SafeBackup/CliParser.hpp"
#include "SafeBackup/Core.hpp"
#include <iostream>

int main(int argc, char** argv) {
    // CliParser defines and parses all command-line arguments using CLI11.
    SafeBackup::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // Without a subcommand Core runs the interactive prompt.
    SafeBackup::Core core(parser.getCommands());

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error during execution: " << e.what() << std::endl;
        return 1;
    }
}
