#include "gravsim/command_line.hpp"
#include "gravsim/error_handling.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <ostream>
#include <string>

namespace gravsim {

namespace {

unsigned long parseUnsigned(const std::string& flag, const std::string& value,
                            unsigned long max = std::numeric_limits<unsigned long>::max()) {
    if (value.empty() || value[0] == '-') {
        throw ValidationException("--" + flag + " expects a non-negative integer, got '" + value + "'");
    }
    char* end = nullptr;
    errno = 0;
    unsigned long result = std::strtoul(value.c_str(), &end, 10);
    if (*end != '\0') {
        throw ValidationException("--" + flag + " expects a non-negative integer, got '" + value + "'");
    }
    if (errno == ERANGE || result > max) {
        throw ValidationException("--" + flag + " must be at most " + std::to_string(max) +
                                  ", got '" + value + "'");
    }
    return result;
}

double parseDouble(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    double result = std::strtod(value.c_str(), &end);
    if (value.empty() || *end != '\0') {
        throw ValidationException("--" + flag + " expects a number, got '" + value + "'");
    }
    return result;
}

} // namespace

CommandLineOptions parseCommandLine(int argc, const char* const argv[]) {
    CommandLineOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            throw ValidationException("Unexpected argument '" + arg + "'");
        }

        std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
        if (name == "h" || name == "help") {
            options.show_help = true;
            continue;
        }

        std::string value;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            throw ValidationException("Missing value for --" + name);
        }

        if (name == "saveFile" || name == "load") {
            options.config.load_path = value;
        } else if (name == "numBodies") {
            options.config.body_count = parseUnsigned(name, value);
        } else if (name == "seed") {
            options.config.seed = static_cast<unsigned int>(
                parseUnsigned(name, value, std::numeric_limits<unsigned int>::max()));
            options.config.use_fixed_seed = true;
        } else if (name == "gravity") {
            options.config.G = parseDouble(name, value);
        } else if (name == "output") {
            options.config.save_path = value;
        } else {
            throw ValidationException("Unknown flag --" + name);
        }
    }

    return options;
}

void printUsage(std::ostream& out) {
    out << "\nGravity Simulation\n"
        << "Usage:\n"
        << "  gravsim [--saveFile <path>] [--numBodies <n>] [--seed <n>]\n"
        << "          [--gravity <G>] [--output <path>]\n\n"
        << "Flags:\n"
        << "  --saveFile  Save file to load; without it bodies are seeded randomly\n"
        << "  --numBodies Number of random bodies (default 5)\n"
        << "  --seed      Fixed random seed (default: current time)\n"
        << "  --gravity   Gravitational constant (default 100)\n"
        << "  --output    Where the O key saves state (default save.csv)\n"
        << "  -h          Display this help and quit\n\n"
        << "Controls:\n"
        << "  W/A/S/D    - Move view window up/left/down/right\n"
        << "  Q/E        - Zoom out/in\n"
        << "  Up/Down    - Increase/decrease the rate of view window movement\n"
        << "  Left/Right - Slow down/speed up the simulation\n"
        << "  Space      - Pause/Resume\n"
        << "  X          - Toggle particle trails\n"
        << "  C          - Advance a single timestep\n"
        << "  R          - Reset the view window\n"
        << "  P          - Print all bodies and settings\n"
        << "  O          - Save the current state\n"
        << "  Esc        - Quit\n\n";
}

} // namespace gravsim
