#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "docserve/config.hpp"

namespace fs = std::filesystem;

namespace docserve {
namespace config {

namespace {
unsigned long parseNumber(const std::string &what, const std::string &value, unsigned long max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid " + what + ": '" + value + "'");
    }
    errno = 0;
    unsigned long n = std::strtoul(value.c_str(), nullptr, 10);
    if (errno == ERANGE || n > max) {
        throw std::invalid_argument(what + " out of range: '" + value + "'");
    }
    return n;
}

uint16_t parsePort(const std::string &value) {
    return static_cast<uint16_t>(parseNumber("port", value, 65535));
}

std::string optionValue(int argc, const char *const argv[], int &i) {
    const std::string option = argv[i];
    if (i + 1 >= argc) {
        throw std::invalid_argument("option " + option + " requires a value");
    }
    return argv[++i];
}
}  // namespace

Options parseCommandLine(int argc, const char *const argv[], const envLookup &getEnv) {
    Options options;
    Settings &settings = options.settings_;

    if (getEnv) {
        const char *port = getEnv("PORT");
        if (port != nullptr && *port != '\0') {
            settings.port_ = parsePort(port);
        }
        const char *host = getEnv("HOST");
        if (host != nullptr && *host != '\0') {
            settings.address_ = host;
        }
    }

    bool havePort = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.showHelp_ = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose_ = true;
        } else if (arg == "-b" || arg == "--bind") {
            settings.address_ = optionValue(argc, argv, i);
        } else if (arg == "-d" || arg == "--directory") {
            settings.docRoot_ = optionValue(argc, argv, i);
        } else if (arg == "-i" || arg == "--index") {
            settings.indexFilename_ = optionValue(argc, argv, i);
        } else if (arg == "-t" || arg == "--timeout") {
            settings.ioTimeout_ =
                std::chrono::seconds(parseNumber("timeout", optionValue(argc, argv, i), 86400));
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else if (!havePort) {
            settings.port_ = parsePort(arg);
            havePort = true;
        } else {
            throw std::invalid_argument("unexpected argument '" + arg + "'");
        }
    }

    if (options.showHelp_) {
        return options;
    }

    if (settings.address_.empty()) {
        throw std::invalid_argument("bind address must not be empty");
    }
    if (settings.indexFilename_.empty() ||
        settings.indexFilename_.find('/') != std::string::npos || settings.indexFilename_ == "." ||
        settings.indexFilename_ == "..") {
        throw std::invalid_argument("invalid index file name '" + settings.indexFilename_ + "'");
    }
    std::error_code ec;
    if (!fs::is_directory(settings.docRoot_, ec)) {
        throw std::invalid_argument("document root '" + settings.docRoot_ +
                                    "' is not a directory");
    }

    return options;
}

std::string usage(const std::string &program) {
    return "Usage: " + program +
           " [options] [port]\n"
           "  port                  port to listen on (default: $PORT or 8000)\n"
           "  -b, --bind ADDRESS    address to bind to (default: $HOST or 0.0.0.0)\n"
           "  -d, --directory DIR   document root (default: current directory)\n"
           "  -i, --index NAME      file served for directories (default: index.html)\n"
           "  -t, --timeout SECS    read/write timeout per connection (default: 30)\n"
           "  -v, --verbose         print debug messages\n"
           "  -h, --help            show this help\n";
}

}  // namespace config
}  // namespace docserve
