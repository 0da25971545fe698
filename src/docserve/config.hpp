#pragma once

#include <functional>
#include <string>

#include "docserve/docserve_common.hpp"

namespace docserve {
namespace config {

// Returns the value of an environment variable or nullptr.
using envLookup = std::function<const char *(const char *name)>;

struct Options {
    Settings settings_;
    bool verbose_ = false;
    bool showHelp_ = false;
};

// Build the options from the command line, falling back on the PORT and
// HOST environment variables and then on the Settings defaults. Throws
// std::invalid_argument naming the offending option.
Options parseCommandLine(int argc, const char *const argv[], const envLookup &getEnv);

std::string usage(const std::string &program);

}  // namespace config
}  // namespace docserve
