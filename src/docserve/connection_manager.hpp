#pragma once

#include <memory>
#include <set>
#include <string>

#include "docserve/connection.hpp"
#include "docserve/docserve_common.hpp"

namespace docserve {

// Manages open connections so that they may be cleanly stopped when the server
// needs to shut down.
class ConnectionManager {
   public:
    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    // Construct a connection manager.
    explicit ConnectionManager(const Settings &settings);
    ~ConnectionManager() = default;

    // Add the specified connection to the manager and start it.
    void start(std::shared_ptr<Connection> c);

    // Stop the specified connection.
    void stop(std::shared_ptr<Connection> c);

    // Stop all connections.
    void stopAll();

    // Close idle connections now, and the others once their current
    // response is written.
    void drain();

    // Close connections that timed out. Called periodically.
    void tick();

    size_t size() const;

    // Handler for debug messages.
    void setDebugMsgHandler(const debugMsgCallback &cb);

    // Handler for access log lines.
    void setAccessLogHandler(const accessLogCallback &cb);

    // Connections may use the debug message and access log handlers.
    void debugMsg(const std::string &msg);
    void accessLog(const std::string &line);

   private:
    // The managed connections.
    std::set<std::shared_ptr<Connection>> connections_;

    // Settings for connections.
    const Settings &settings_;

    // Set once drain() has been called, new connections are not kept alive.
    bool draining_ = false;

    // Callback to handle debug messages.
    debugMsgCallback debugMsgCb_;

    accessLogCallback accessLogCb_;
};

}  // namespace docserve
