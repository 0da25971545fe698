#include <asio.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "docserve/config.hpp"
#include "docserve/server.hpp"

using namespace docserve;

int main(int argc, char *argv[]) {
    config::Options options;
    try {
        options = config::parseCommandLine(
            argc, argv, [](const char *name) { return std::getenv(name); });
    } catch (const std::invalid_argument &e) {
        std::cerr << "docserve: " << e.what() << "\n" << config::usage(argv[0]);
        return 2;
    }

    if (options.showHelp_) {
        std::cout << config::usage(argv[0]);
        return 0;
    }

    const Settings &settings = options.settings_;
    asio::io_context ioc;

    std::unique_ptr<Server> server;
    try {
        server = std::make_unique<Server>(ioc, settings);
    } catch (const std::system_error &e) {
        std::cerr << "docserve: cannot listen on " << settings.address_ << ":" << settings.port_
                  << ": " << e.what() << "\n";
        return 1;
    }

    server->setAccessLogHandler([](const std::string &line) { std::cerr << line << std::endl; });
    server->setErrorLogHandler(
        [](const std::string &msg) { std::cerr << "[ERROR] " << msg << std::endl; });
    if (options.verbose_) {
        server->setDebugMsgHandler(
            [](const std::string &msg) { std::cerr << "[DEBUG] " << msg << std::endl; });
    }

    const std::string address = server->getBindedAddress();
    const uint16_t port = server->getBindedPort();
    std::cout << "Serving HTTP on " << address << " port " << port << " (http://" << address << ":"
              << port << "/) ..." << std::endl;

    try {
        // Run the server until stopped with a signal.
        ioc.run();
    } catch (const std::exception &e) {
        std::cerr << "docserve: exception: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Shutting down." << std::endl;
    return 0;
}
