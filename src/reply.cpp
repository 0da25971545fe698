#include <string>

#include "docserve/reply.hpp"

namespace docserve {

namespace misc_strings {

const char name_value_separator[] = {':', ' '};
const char crlf[] = {'\r', '\n'};

}  // namespace misc_strings

Reply::Reply(std::vector<char> &content) : content_(content), status_(status_type::ok) {
    headers_.reserve(8);
}

std::string Reply::reasonPhrase(status_type status) {
    switch (status) {
        case ok:
            return "OK";
        case moved_permanently:
            return "Moved Permanently";
        case not_modified:
            return "Not Modified";
        case bad_request:
            return "Bad Request";
        case forbidden:
            return "Forbidden";
        case not_found:
            return "Not Found";
        case method_not_allowed:
            return "Method Not Allowed";
        case request_header_fields_too_large:
            return "Request Header Fields Too Large";
        case internal_server_error:
            return "Internal Server Error";
        case not_implemented:
            return "Not Implemented";
        case version_not_supported:
            return "HTTP Version Not Supported";
        default:
            return "Internal Server Error";
    }
}

void Reply::addHeader(const std::string &name, const std::string &val) {
    headers_.push_back({name, val});
}

std::string Reply::getHeaderValue(const std::string &name) const {
    for (const auto &header : headers_) {
        if (Request::iequals(header.name_, name)) {
            return header.value_;
        }
    }
    return "";
}

void Reply::send(status_type status) {
    status_ = status;
    content_.clear();

    if (status != not_modified) {
        headers_.push_back({"Content-Length", "0"});
    }

    returnToClient_ = true;
}

void Reply::stockReply(const Request &req, Reply::status_type status) {
    status_ = status;
    headers_.clear();

    const std::string title = std::to_string(static_cast<int>(status)) + " " + reasonPhrase(status);
    const std::string page = "<!DOCTYPE html>\n<html><head><title>" + title +
                             "</title></head>\n<body><h1>" + title + "</h1></body></html>\n";
    content_.assign(page.begin(), page.end());

    addHeader("Content-Type", "text/html; charset=utf-8");
    addHeader("Content-Length", std::to_string(content_.size()));

    if (status_ >= 400) {
        addHeader("Connection", "close");
    }

    if (req.method_ == "HEAD") {
        content_.clear();
    }
    returnToClient_ = true;
}

void Reply::redirect(const Request &req, const std::string &location) {
    stockReply(req, moved_permanently);
    addHeader("Location", location);
}

std::vector<asio::const_buffer> Reply::headerToBuffers() {
    std::vector<asio::const_buffer> buffers;

    statusLine_ = "HTTP/1.1 " + std::to_string(static_cast<int>(status_)) + " " +
                  reasonPhrase(status_) + "\r\n";
    buffers.push_back(asio::buffer(statusLine_));
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        Header &h = headers_[i];
        buffers.push_back(asio::buffer(h.name_));
        buffers.push_back(asio::buffer(misc_strings::name_value_separator));
        buffers.push_back(asio::buffer(h.value_));
        buffers.push_back(asio::buffer(misc_strings::crlf));
    }
    buffers.push_back(asio::buffer(misc_strings::crlf));
    return buffers;
}

std::vector<asio::const_buffer> Reply::contentToBuffers() {
    std::vector<asio::const_buffer> buffers;
    buffers.push_back(asio::buffer(content_));
    return buffers;
}

}  // namespace docserve
