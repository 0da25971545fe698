#pragma once

#include <asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "docserve/docserve_common.hpp"
#include "docserve/reply.hpp"
#include "docserve/request.hpp"
#include "docserve/request_decoder.hpp"
#include "docserve/request_handler.hpp"
#include "docserve/request_parser.hpp"

namespace docserve {

class ConnectionManager;

// Represents a single connection from a client.
class Connection : public std::enable_shared_from_this<Connection> {
   public:
    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Construct a connection with the given socket.
    explicit Connection(asio::ip::tcp::socket socket,
                        ConnectionManager &manager,
                        RequestHandler &handler,
                        unsigned connectionId,
                        const Settings &settings);
    ~Connection() = default;

    // Start the first asynchronous operation for the connection.
    void start(bool useKeepAlive);

    // Stop all asynchronous operations associated with the connection.
    void stop();

    // Close the connection as soon as the current response, if any, has
    // been written.
    void closeAfterResponse();

    std::chrono::steady_clock::time_point getLastActivityTime() const;
    size_t getNrOfRequests() const;

    // True while waiting for the first byte of a request.
    bool isIdle() const;

   private:
    // Perform an asynchronous read operation.
    void doRead();

    // Perform an asynchronous write operation.
    void doWriteHeaders();
    void doWriteReplyContent();

    void parseReceived();
    void handleParseResult(RequestParser::result_type result);
    void handleConnection();
    void handleWriteCompleted();
    void logAccess();

    void shutdown();

    // Socket for the connection.
    asio::ip::tcp::socket socket_;

    // The manager for this connection.
    ConnectionManager &connectionManager_;

    // The handler used to process the incoming request.
    RequestHandler &requestHandler_;

    // The unique id for the connection.
    unsigned connectionId_;

    // Server settings, owned by the Server.
    const Settings &settings_;

    // Buffers for incoming and outgoing data.
    std::vector<char> recvBuffer_;
    std::vector<char> sendBuffer_;

    // Parse position in recvBuffer_. Bytes beyond it are the start of a
    // pipelined request, parsed once the current reply is written.
    size_t recvPos_ = 0;

    // The incoming request.
    Request request_;

    // The parser for the incoming request.
    RequestParser requestParser_;

    // The decoder for the incoming request.
    RequestDecoder requestDecoder_;

    // The reply to be sent back to the client.
    Reply reply_;

    // Peer address, for the access log.
    std::string remoteAddress_;

    // Last time data was read from or written to the socket.
    std::chrono::steady_clock::time_point lastActivityTime_;

    // Support keep-alive or not.
    bool useKeepAlive_ = false;

    // Request counter
    size_t nrOfRequest_ = 0;

    // A request is being received or answered.
    bool busy_ = false;

    bool closeConnection_ = false;
    bool closeAfterResponse_ = false;
};

}  // namespace docserve
