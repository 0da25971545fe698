#pragma once

#include "docserve/docserve_common.hpp"
#include "docserve/i_file_io.hpp"
#include "docserve/path_resolver.hpp"
#include "docserve/reply.hpp"
#include "docserve/request.hpp"

namespace docserve {

class RequestHandler {
   public:
    RequestHandler(const RequestHandler &) = delete;
    RequestHandler &operator=(const RequestHandler &) = delete;

    RequestHandler(const std::string &docRoot, size_t maxContentSize);
    ~RequestHandler() = default;

    void setFileIO(IFileIO *fileIO);

    // Handler for server faults, gets a line with the request, the file
    // involved and the error detail.
    void setErrorLogHandler(const debugMsgCallback &cb);

    // Fill 'rep' for 'req'. Never throws, any unexpected fault becomes a 500.
    void handleRequest(unsigned connectionId, const Request &req, Reply &rep);

    // Read the next chunk of a reply sent in several parts. Returns false if
    // the file could not be read, the reply must then be abandoned.
    bool handleFileIORead(unsigned connectionId, const Request &req, Reply &rep);

    void closeFile(unsigned connectionId);

   private:
    void doHandleRequest(unsigned connectionId, const Request &req, Reply &rep);
    void openAndReadFile(unsigned connectionId, const Request &req, Reply &rep);
    int readFromFile(unsigned connectionId, const Request &req, Reply &rep);
    void logServerError(const Request &req, const Reply &rep);

    const PathResolver resolver_;

    // The max buffer size when writing socket.
    const size_t maxContentSize_;

    // Provided FileIO, normally a FileIO on the document root.
    IFileIO *fileIO_ = nullptr;

    debugMsgCallback errorLogCb_;
};

}  // namespace docserve
