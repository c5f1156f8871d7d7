#pragma once

#include "gravsim/types.hpp"
#include <iosfwd>

namespace gravsim {

struct CommandLineOptions {
    SimulationConfig config;
    bool show_help = false;
};

// Parse the viewer's flags. Flags take one or two leading dashes and their
// value either as the next argument or after '='.
//   --saveFile <path>   load bodies from a save file (alias --load)
//   --numBodies <n>     number of random bodies when no file is given
//   --seed <n>          fixed random seed
//   --gravity <G>       gravitational constant
//   --output <path>     file written by the save-state control
//   -h, --help          print usage and exit
// Throws ValidationException on an unknown flag or malformed value.
CommandLineOptions parseCommandLine(int argc, const char* const argv[]);

void printUsage(std::ostream& out);

} // namespace gravsim
