// main.cpp
#include "cli.h"
#include "logger.h"
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        return runCli(argc, argv, std::cin, std::cout, std::cerr);
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal exception in main: %s", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
