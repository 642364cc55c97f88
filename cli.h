// cli.h
#ifndef CLI_H
#define CLI_H

#include <iosfwd>

// Run the tool for one command line and return the exit status (0 or 1).
// `in` is only read when no UUID arguments were given.
int runCli(int argc, const char* const* argv,
           std::istream& in, std::ostream& out, std::ostream& err);

#endif // CLI_H
