#include <chrono>

#include "docserve/connection_manager.hpp"

namespace {
void defaultDebugMsgHandler(const std::string &) {}
}  // namespace

namespace docserve {

ConnectionManager::ConnectionManager(const Settings &settings)
    : settings_(settings),
      debugMsgCb_(defaultDebugMsgHandler),
      accessLogCb_(defaultDebugMsgHandler) {}

void ConnectionManager::start(std::shared_ptr<Connection> c) {
    connections_.insert(c);
    bool useKeepAlive = false;
    if (!draining_ && settings_.keepAliveTimeout_ != std::chrono::seconds(0) &&
        (settings_.connectionLimit_ == 0 ||  // 0 = unlimited
         connections_.size() <= settings_.connectionLimit_)) {
        useKeepAlive = true;
    }
    c->start(useKeepAlive);
}

void ConnectionManager::stop(std::shared_ptr<Connection> c) {
    connections_.erase(c);
    c->stop();
}

void ConnectionManager::stopAll() {
    for (auto c : connections_) {
        c->stop();
    }
    connections_.clear();
}

void ConnectionManager::drain() {
    draining_ = true;
    auto it = connections_.begin();
    while (it != connections_.end()) {
        if ((*it)->isIdle()) {
            (*it)->stop();
            it = connections_.erase(it);
        } else {
            (*it)->closeAfterResponse();
            it++;
        }
    }
}

void ConnectionManager::tick() {
    auto now = std::chrono::steady_clock::now();
    auto it = connections_.begin();
    while (it != connections_.end()) {
        const Connection &c = **it;
        bool erase = false;

        if (c.isIdle() && c.getNrOfRequests() > 0) {
            // between requests on a persistent connection
            if (c.getLastActivityTime() + settings_.keepAliveTimeout_ < now) {
                debugMsgCb_("Removing HTTP connection due to inactivity");
                erase = true;
            }
        } else if (settings_.ioTimeout_ != std::chrono::seconds(0) &&
                   c.getLastActivityTime() + settings_.ioTimeout_ < now) {
            debugMsgCb_("Removing HTTP connection due to I/O timeout");
            erase = true;
        }

        if (erase) {
            (*it)->stop();
            it = connections_.erase(it);
        } else {
            it++;
        }
    }
}

size_t ConnectionManager::size() const {
    return connections_.size();
}

void ConnectionManager::setDebugMsgHandler(const debugMsgCallback &cb) {
    debugMsgCb_ = cb;
}

void ConnectionManager::setAccessLogHandler(const accessLogCallback &cb) {
    accessLogCb_ = cb;
}

void ConnectionManager::debugMsg(const std::string &msg) {
    debugMsgCb_(msg);
}

void ConnectionManager::accessLog(const std::string &line) {
    accessLogCb_(line);
}

}  // namespace docserve
