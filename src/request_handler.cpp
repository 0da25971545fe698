#include <exception>

#include "docserve/mime_types.hpp"
#include "docserve/request_handler.hpp"

namespace fs = std::filesystem;

namespace {
void defaultErrorLogHandler(const std::string &) {}
}  // namespace

namespace docserve {

RequestHandler::RequestHandler(const std::string &docRoot, size_t maxContentSize)
    : resolver_(docRoot), maxContentSize_(maxContentSize), errorLogCb_(defaultErrorLogHandler) {}

void RequestHandler::setFileIO(IFileIO *fileIO) {
    fileIO_ = fileIO;
}

void RequestHandler::setErrorLogHandler(const debugMsgCallback &cb) {
    errorLogCb_ = cb;
}

void RequestHandler::handleRequest(unsigned connectionId, const Request &req, Reply &rep) {
    try {
        doHandleRequest(connectionId, req, rep);
    } catch (const std::exception &e) {
        closeFile(connectionId);
        rep.stockReply(req, Reply::internal_server_error);
        rep.errorDetail_ = e.what();
    }

    if (rep.status_ >= Reply::internal_server_error) {
        logServerError(req, rep);
    }
}

void RequestHandler::doHandleRequest(unsigned connectionId, const Request &req, Reply &rep) {
    if (!req.isReadOnlyMethod()) {
        rep.stockReply(req, Reply::method_not_allowed);
        rep.addHeader("Allow", "GET, HEAD");
        return;
    }

    fs::path resolved;
    switch (resolver_.resolve(req.requestPath_, resolved)) {
        case PathResolver::ok:
            break;
        case PathResolver::outside_root:
            rep.stockReply(req, Reply::forbidden);
            return;
        case PathResolver::bad_path:
        default:
            rep.stockReply(req, Reply::bad_request);
            return;
    }

    rep.filePath_ = resolved.string();
    rep.fileExtension_ = mime_types::extensionOf(req.requestPath_);

    if (fileIO_ == nullptr) {
        rep.stockReply(req, Reply::not_implemented);
        return;
    }

    openAndReadFile(connectionId, req, rep);
}

bool RequestHandler::handleFileIORead(unsigned connectionId, const Request &req, Reply &rep) {
    int nrReadBytes = readFromFile(connectionId, req, rep);
    if (nrReadBytes < 0) {
        rep.errorDetail_ = "read failed";
        logServerError(req, rep);
        closeFile(connectionId);
        return false;
    }

    if (static_cast<size_t>(nrReadBytes) < maxContentSize_) {
        rep.finalPart_ = true;
        closeFile(connectionId);
    }
    return true;
}

void RequestHandler::closeFile(unsigned connectionId) {
    if (fileIO_ != nullptr) {
        fileIO_->closeReadFile(std::to_string(connectionId));
    }
}

void RequestHandler::openAndReadFile(unsigned connectionId, const Request &req, Reply &rep) {
    // open the file to send back
    size_t contentSize = fileIO_->openFileForRead(std::to_string(connectionId), req, rep);

    if (rep.returnToClient_) {
        // FileIO already replied, e.g. 404, 301 or 304
        return;
    }

    if (req.method_ == "HEAD") {
        // HEAD request, no content
        rep.content_.clear();
        closeFile(connectionId);
    } else {
        // fill initial content
        rep.replyPartial_ = contentSize > maxContentSize_;
        int nrReadBytes = readFromFile(connectionId, req, rep);
        if (nrReadBytes < 0) {
            closeFile(connectionId);
            rep.stockReply(req, Reply::internal_server_error);
            rep.errorDetail_ = "read failed";
            return;
        }
        if (!rep.replyPartial_) {
            // all data fits in initial content
            closeFile(connectionId);
        }
    }

    rep.status_ = Reply::ok;
    rep.addHeader("Content-Length", std::to_string(contentSize));
    rep.addHeader("Content-Type", mime_types::extensionToType(rep.fileExtension_));
    rep.returnToClient_ = true;
}

int RequestHandler::readFromFile(unsigned connectionId, const Request &req, Reply &rep) {
    rep.content_.resize(maxContentSize_);
    int nrReadBytes = fileIO_->readFile(
        std::to_string(connectionId), req, rep.content_.data(), rep.content_.size());
    rep.content_.resize(nrReadBytes > 0 ? nrReadBytes : 0);
    return nrReadBytes;
}

void RequestHandler::logServerError(const Request &req, const Reply &rep) {
    errorLogCb_(req.requestLine() + ": " + (rep.filePath_.empty() ? "-" : rep.filePath_) + ": " +
                (rep.errorDetail_.empty() ? Reply::reasonPhrase(rep.status_) : rep.errorDetail_));
}

}  // namespace docserve
