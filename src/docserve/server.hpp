#pragma once

#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "docserve/connection.hpp"
#include "docserve/connection_manager.hpp"
#include "docserve/docserve_common.hpp"
#include "docserve/file_io.hpp"
#include "docserve/request_handler.hpp"

namespace docserve {

// Serves the files below settings.docRoot_. The listening socket is bound in
// the constructor, which throws std::system_error if that fails (e.g. the
// port is in use). Requests are served while the io_context runs; after
// stop(), or SIGINT/SIGTERM, the io_context runs out of work once the
// connections are drained.
class Server {
   public:
    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    explicit Server(asio::io_context &ioContext, const Settings &settings);
    ~Server() = default;

    uint16_t getBindedPort() const;
    std::string getBindedAddress() const;

    // Handlers to be optionally implemented.
    void setDebugMsgHandler(const debugMsgCallback &cb);
    void setErrorLogHandler(const debugMsgCallback &cb);
    void setAccessLogHandler(const accessLogCallback &cb);

    // Stop accepting connections and drain the open ones, bounded by
    // settings.drainTimeout_. Safe to call more than once.
    void stop();

   private:
    void doAccept();
    void doAwaitStop();
    void doTick();

    const Settings settings_;

    std::shared_ptr<asio::signal_set> signals_;
    asio::ip::tcp::acceptor acceptor_;
    ConnectionManager connectionManager_;
    FileIO fileIO_;
    RequestHandler requestHandler_;

    // Unique Id for each connection.
    unsigned connectionId_ = 0;

    // Timer to handle connection status.
    asio::steady_timer timer_;

    bool stopped_ = false;
    std::chrono::steady_clock::time_point drainDeadline_;

    // Callback to handle debug messages.
    debugMsgCallback debugMsgCb_;
    debugMsgCallback errorLogCb_;
};

}  // namespace docserve
