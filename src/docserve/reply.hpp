#pragma once

#include <asio.hpp>
#include <string>
#include <vector>

#include "docserve/header.hpp"
#include "docserve/request.hpp"

namespace docserve {

class Reply {
    friend class RequestHandler;
    friend class Connection;

   public:
    Reply(const Reply &) = delete;
    Reply &operator=(const Reply &) = delete;

    explicit Reply(std::vector<char> &content);
    virtual ~Reply() = default;

    enum status_type {
        ok = 200,
        moved_permanently = 301,
        not_modified = 304,
        bad_request = 400,
        forbidden = 403,
        not_found = 404,
        method_not_allowed = 405,
        request_header_fields_too_large = 431,
        internal_server_error = 500,
        not_implemented = 501,
        version_not_supported = 505
    };

    // Content to be sent in the reply.
    std::vector<char> &content_;

    // Resolved filesystem path of the file to send.
    std::string filePath_;

    // Extension of the file to send.
    std::string fileExtension_;

    // Detail of a failure, logged together with filePath_ for 5xx replies.
    std::string errorDetail_;

    // Reply without content, e.g. 304.
    void send(status_type status);

    // Standard server reply with a short html page describing the status.
    // Error replies also close the connection.
    void stockReply(const Request &req, status_type status);

    // 301 to 'location'.
    void redirect(const Request &req, const std::string &location);

    void addHeader(const std::string &name, const std::string &val);
    std::string getHeaderValue(const std::string &name) const;

    status_type getStatus() const {
        return status_;
    }

    bool isReadyToSend() const {
        return returnToClient_;
    }

    static std::string reasonPhrase(status_type status);

   private:
    void reset() {
        content_.clear();
        filePath_.clear();
        fileExtension_.clear();
        errorDetail_.clear();
        headers_.clear();
        status_ = ok;
        returnToClient_ = false;
        replyPartial_ = false;
        finalPart_ = false;
        bodyBytesSent_ = 0;
    }

    // The status code of the reply.
    status_type status_;

    // Headers to be included in the reply.
    std::vector<Header> headers_;

    // Set to true when the reply is ready to be sent to the client.
    bool returnToClient_ = false;

    // Keep track when replying with successive write buffers.
    bool replyPartial_ = false;
    bool finalPart_ = false;

    // Number of body bytes written to the socket, for the access log.
    size_t bodyBytesSent_ = 0;

    // The status line is kept here so the buffers below stay valid during
    // the asynchronous write.
    std::string statusLine_;

    // Convert the reply into a vector of buffers. The buffers do not own the
    // underlying memory blocks, therefore the reply object must remain valid
    // and not be changed until the write operation has completed.
    std::vector<asio::const_buffer> headerToBuffers();
    std::vector<asio::const_buffer> contentToBuffers();
};

}  // namespace docserve
