#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace docserve {

#define DOCSERVE_VERSION "1.0.0"

using debugMsgCallback = std::function<void(const std::string &msg)>;

// Called once per completed response with a ready formatted log line.
using accessLogCallback = std::function<void(const std::string &line)>;

struct Settings {
    Settings(std::string docRoot = ".",
             std::string address = "0.0.0.0",
             uint16_t port = 8000,
             std::string indexFilename = "index.html",
             std::chrono::seconds keepAliveTimeout = std::chrono::seconds(5),
             size_t keepAliveMax = 100,
             size_t connectionLimit = 0,
             std::chrono::seconds ioTimeout = std::chrono::seconds(30),
             std::chrono::seconds drainTimeout = std::chrono::seconds(5))
        : docRoot_(std::move(docRoot)),
          address_(std::move(address)),
          port_(port),
          indexFilename_(std::move(indexFilename)),
          keepAliveTimeout_(keepAliveTimeout),
          keepAliveMax_(keepAliveMax),
          connectionLimit_(connectionLimit),
          ioTimeout_(ioTimeout),
          drainTimeout_(drainTimeout) {}

    // Directory files are served from. Nothing outside it is ever served.
    std::string docRoot_;

    // Address and port to bind the listening socket to. Port 0 lets the
    // OS pick a free port, see Server::getBindedPort().
    std::string address_;
    uint16_t port_;

    // File substituted when a directory is requested.
    std::string indexFilename_;

    // Keep-Alive timeout for inactive connections. Sent in Keep-Alive response header.
    // 0s = Keep-Alive disabled.
    std::chrono::seconds keepAliveTimeout_;

    // Max number of request that can be processed on the connection before it is closed.
    // Sent in Keep-Alive response header.
    size_t keepAliveMax_;

    // Internal limitation of the number of persistent http connections
    // that are allowed. If this limit is exceeded, Connection=close will be
    // sent in the response for new connections.
    // 0 = no limit.
    size_t connectionLimit_;

    // Connections without any socket activity for this long are closed,
    // also while a request is only partially received.
    // 0s = no timeout.
    std::chrono::seconds ioTimeout_;

    // Grace period for in-flight responses when the server is stopped.
    std::chrono::seconds drainTimeout_;

    // The max buffer size when reading/writing socket. Files larger than
    // this are sent in several writes.
    size_t maxContentSize_ = 64 * 1024;

    // Request line and headers larger than this are rejected.
    size_t maxHeaderSize_ = 8 * 1024;
};

}  // namespace docserve
