#include <signal.h>
#include <chrono>
#include <utility>

#include "docserve/server.hpp"

namespace {
void defaultDebugMsgHandler(const std::string &) {}
}

namespace docserve {

Server::Server(asio::io_context &ioContext, const Settings &settings)
    : settings_(settings),
      acceptor_(ioContext),
      connectionManager_(settings_),
      fileIO_(settings_.docRoot_, settings_.indexFilename_),
      requestHandler_(settings_.docRoot_, settings_.maxContentSize_),
      timer_(ioContext),
      debugMsgCb_(defaultDebugMsgHandler),
      errorLogCb_(defaultDebugMsgHandler) {
    requestHandler_.setFileIO(&fileIO_);

    // Open the acceptor with the option to reuse the address (i.e.
    // SO_REUSEADDR). Any failure here is fatal and left to the caller.
    asio::ip::tcp::resolver resolver(ioContext);
    asio::ip::tcp::endpoint endpoint =
        *resolver.resolve(settings_.address_, std::to_string(settings_.port_)).begin();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    // Register to handle the signals that indicate when the server should exit.
    // It is safe to register for the same signal multiple times in a program,
    // provided all registration for the specified signal is made through Asio.
    signals_ = std::make_shared<asio::signal_set>(ioContext);
    signals_->add(SIGINT);
    signals_->add(SIGTERM);
#if defined(SIGQUIT)
    signals_->add(SIGQUIT);
#endif  // defined(SIGQUIT)
    doAwaitStop();

    doAccept();
    doTick();
}

uint16_t Server::getBindedPort() const {
    return acceptor_.local_endpoint().port();
}

std::string Server::getBindedAddress() const {
    return acceptor_.local_endpoint().address().to_string();
}

void Server::setDebugMsgHandler(const debugMsgCallback &cb) {
    connectionManager_.setDebugMsgHandler(cb);
    debugMsgCb_ = cb;
}

void Server::setErrorLogHandler(const debugMsgCallback &cb) {
    requestHandler_.setErrorLogHandler(cb);
    errorLogCb_ = cb;
}

void Server::setAccessLogHandler(const accessLogCallback &cb) {
    connectionManager_.setAccessLogHandler(cb);
}

void Server::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    drainDeadline_ = std::chrono::steady_clock::now() + settings_.drainTimeout_;

    std::error_code ignored_ec;
    acceptor_.close(ignored_ec);
    if (signals_) {
        signals_->cancel(ignored_ec);
    }
    connectionManager_.drain();
    debugMsgCb_("stop: draining " + std::to_string(connectionManager_.size()) + " connections");

    // Let the tick timer notice the drain right away.
    timer_.cancel();
    doTick();
}

void Server::doAccept() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket) {
        // Check whether the server was stopped by a signal before this
        // completion handler had a chance to run.
        if (!acceptor_.is_open()) {
            return;
        }

        if (!ec) {
            connectionManager_.start(std::make_shared<Connection>(std::move(socket),
                                                                  connectionManager_,
                                                                  requestHandler_,
                                                                  connectionId_++,
                                                                  settings_));
        } else {
            // e.g. out of file descriptors, keep accepting
            errorLogCb_("doAccept: " + ec.message() + ":" + std::to_string(ec.value()));
        }

        doAccept();
    });
}

void Server::doAwaitStop() {
    signals_->async_wait([this](std::error_code ec, int /*signo*/) {
        if (!ec) {
            stop();
        }
    });
}

void Server::doTick() {
    if (stopped_) {
        if (connectionManager_.size() == 0) {
            // Nothing left, the io_context runs out of work.
            return;
        }
        if (std::chrono::steady_clock::now() >= drainDeadline_) {
            debugMsgCb_("stop: drain timeout, closing " +
                        std::to_string(connectionManager_.size()) + " connections");
            connectionManager_.stopAll();
            return;
        }
    }

    timer_.expires_after(stopped_ ? std::chrono::milliseconds(50) : std::chrono::seconds(1));
    timer_.async_wait([this](std::error_code ec) {
        if (!ec) {
            connectionManager_.tick();

            doTick();
        }
    });
}

}  // namespace docserve
