// config.h
#ifndef CONFIG_H
#define CONFIG_H

#include "output_format.h"
#include <string>
#include <vector>

// Settings for one invocation, built from the command line
struct Config {
    OutputFormat format = OutputFormat::ISO;
    bool quiet = false;
    std::vector<std::string> uuids;   // Empty means read standard input
    std::string logFile;              // Empty disables the debug log
};

#endif // CONFIG_H
