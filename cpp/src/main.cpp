#include "cli.h"
#include "errors.h"
#include "utils.h"
#include <iostream>
#include <exception>

int main(int argc, char* argv[]) {
    try {
        promptvault::CLI cli;

        if (!cli.parseArgs(argc, argv)) {
            return 0; // Help or version displayed
        }

        return cli.run();

    } catch (const promptvault::StorageError& e) {
        promptvault::utils::terminal::printError(std::string("Fatal storage error: ") + e.what());
        return 1;
    } catch (const promptvault::Error& e) {
        promptvault::utils::terminal::printError(e.what());
        return 2;
    } catch (const std::exception& e) {
        promptvault::utils::terminal::printError(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
