#include <ctime>
#include <strings.h>

#include "docserve/connection.hpp"
#include "docserve/connection_manager.hpp"
#include "docserve/http_date.hpp"

namespace docserve {

Connection::Connection(asio::ip::tcp::socket socket,
                       ConnectionManager &manager,
                       RequestHandler &handler,
                       unsigned connectionId,
                       const Settings &settings)
    : socket_(std::move(socket)),
      connectionManager_(manager),
      requestHandler_(handler),
      connectionId_(connectionId),
      settings_(settings),
      recvBuffer_(settings.maxContentSize_),
      sendBuffer_(),
      requestParser_(settings.maxHeaderSize_),
      reply_(sendBuffer_) {
    sendBuffer_.reserve(settings.maxContentSize_);
}

void Connection::start(bool useKeepAlive) {
    lastActivityTime_ = std::chrono::steady_clock::now();
    useKeepAlive_ = useKeepAlive;

    std::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    remoteAddress_ = ec ? std::string("-") : endpoint.address().to_string();

    doRead();
}

void Connection::stop() {
    std::error_code ignored_ec;
    socket_.close(ignored_ec);
    requestHandler_.closeFile(connectionId_);
}

void Connection::closeAfterResponse() {
    closeAfterResponse_ = true;
}

std::chrono::steady_clock::time_point Connection::getLastActivityTime() const {
    return lastActivityTime_;
}

size_t Connection::getNrOfRequests() const {
    return nrOfRequest_;
}

bool Connection::isIdle() const {
    return !busy_;
}

void Connection::doRead() {
    auto self(shared_from_this());
    // Asio uses recvBuffer_.size() to limit amount of read data so must restore
    // size before reading.
    recvBuffer_.resize(settings_.maxContentSize_);
    socket_.async_read_some(
        asio::buffer(recvBuffer_), [this, self](std::error_code ec, std::size_t bytesTransferred) {
            if (!ec) {
                lastActivityTime_ = std::chrono::steady_clock::now();
                recvBuffer_.resize(bytesTransferred);
                recvPos_ = 0;
                parseReceived();
            } else if (ec != asio::error::operation_aborted) {
                if (ec != asio::error::eof) {
                    connectionManager_.debugMsg("doRead: " + ec.message() + ':' +
                                                std::to_string(ec.value()));
                }
                connectionManager_.stop(shared_from_this());
            }
        });
}

void Connection::parseReceived() {
    busy_ = true;
    handleParseResult(requestParser_.parse(request_, recvBuffer_, recvPos_));
}

void Connection::handleParseResult(RequestParser::result_type result) {
    switch (result) {
        case RequestParser::good_complete:
            if (requestDecoder_.decodeRequest(request_)) {
                requestHandler_.handleRequest(connectionId_, request_, reply_);
            } else {
                reply_.stockReply(request_, Reply::bad_request);
            }
            doWriteHeaders();
            break;
        case RequestParser::version_not_supported:
            reply_.stockReply(request_, Reply::version_not_supported);
            doWriteHeaders();
            break;
        case RequestParser::header_too_large:
            reply_.stockReply(request_, Reply::request_header_fields_too_large);
            doWriteHeaders();
            break;
        case RequestParser::bad:
            reply_.stockReply(request_, Reply::bad_request);
            doWriteHeaders();
            break;
        case RequestParser::indeterminate:
        default:
            doRead();
            break;
    }
}

void Connection::doWriteHeaders() {
    handleConnection();
    reply_.addHeader("Server", "docserve/" DOCSERVE_VERSION);
    reply_.addHeader("Date", http_date::format(std::time(nullptr)));

    auto self(shared_from_this());
    asio::async_write(
        socket_, reply_.headerToBuffers(), [this, self](std::error_code ec, std::size_t) {
            if (!ec) {
                lastActivityTime_ = std::chrono::steady_clock::now();

                if (!reply_.content_.empty()) {
                    doWriteReplyContent();
                } else {
                    handleWriteCompleted();
                }
            } else if (ec != asio::error::operation_aborted) {
                connectionManager_.debugMsg("doWriteHeaders: " + ec.message() + ':' +
                                            std::to_string(ec.value()));
                shutdown();
            }
        });
}

void Connection::doWriteReplyContent() {
    auto self(shared_from_this());
    asio::async_write(
        socket_,
        reply_.contentToBuffers(),
        [this, self](std::error_code ec, std::size_t bytesWritten) {
            if (!ec) {
                lastActivityTime_ = std::chrono::steady_clock::now();
                reply_.bodyBytesSent_ += bytesWritten;

                if (reply_.replyPartial_ && !reply_.finalPart_) {
                    if (!requestHandler_.handleFileIORead(connectionId_, request_, reply_)) {
                        // Headers are already sent, all we can do is to
                        // cut the response short.
                        shutdown();
                        return;
                    }
                    if (!reply_.content_.empty()) {
                        doWriteReplyContent();
                        return;
                    }
                }
                handleWriteCompleted();
            } else if (ec != asio::error::operation_aborted) {
                // Typically the client went away in the middle of a response.
                connectionManager_.debugMsg("doWriteReplyContent: " + ec.message() + ':' +
                                            std::to_string(ec.value()));
                shutdown();
            }
        });
}

void Connection::handleConnection() {
    nrOfRequest_++;

    // Check if server wants to close the connection
    const std::string connectionHeader = reply_.getHeaderValue("Connection");
    if (strcasecmp(connectionHeader.c_str(), "close") == 0) {
        closeConnection_ = true;
        return;
    }

    // Check if client wants to close the connection, or if we do
    if (!request_.keepAlive_ || closeAfterResponse_ || !useKeepAlive_ ||
        nrOfRequest_ >= settings_.keepAliveMax_) {
        reply_.addHeader("Connection", "close");
        closeConnection_ = true;
        return;
    }

    reply_.addHeader("Connection", "keep-alive");
    reply_.addHeader("Keep-Alive",
                     "timeout=" + std::to_string(settings_.keepAliveTimeout_.count()) +
                         ", max=" + std::to_string(settings_.keepAliveMax_ - nrOfRequest_));
}

void Connection::handleWriteCompleted() {
    logAccess();

    requestParser_.reset();
    request_.reset();
    reply_.reset();
    busy_ = false;

    if (!closeConnection_ && !closeAfterResponse_) {
        if (recvPos_ < recvBuffer_.size()) {
            // next request already received
            parseReceived();
        } else {
            doRead();
        }
    } else {
        // Initiate graceful connection closure
        std::error_code ignored_ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored_ec);
        connectionManager_.stop(shared_from_this());
    }
}

void Connection::logAccess() {
    connectionManager_.accessLog(remoteAddress_ + " - - [" +
                                 http_date::formatLogTime(std::time(nullptr)) + "] \"" +
                                 request_.requestLine() + "\" " +
                                 std::to_string(static_cast<int>(reply_.getStatus())) + " " +
                                 std::to_string(reply_.bodyBytesSent_));
}

void Connection::shutdown() {
    // Initiate graceful connection closure
    std::error_code ignored_ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored_ec);
    connectionManager_.stop(shared_from_this());
}

}  // namespace docserve
