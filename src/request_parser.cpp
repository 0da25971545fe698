#include <limits>
#include <strings.h>

#include "docserve/parse_common.hpp"
#include "docserve/request.hpp"
#include "docserve/request_parser.hpp"

namespace docserve {

RequestParser::RequestParser(size_t maxHeaderSize)
    : state_(method_start), maxHeaderSize_(maxHeaderSize) {}

void RequestParser::reset() {
    state_ = method_start;
    headerBytes_ = 0;
}

RequestParser::result_type RequestParser::parse(Request &req,
                                                const std::vector<char> &content,
                                                size_t &pos) {
    while (pos < content.size()) {
        if (++headerBytes_ > maxHeaderSize_) {
            return header_too_large;
        }
        result_type result = consume(req, content[pos++]);
        if (result != indeterminate) {
            return result;
        }
    }
    return indeterminate;
}

RequestParser::result_type RequestParser::consume(Request &req, char input) {
    switch (state_) {
        case method_start:
            if (!isChar(input) || isCtl(input) || isTsspecial(input)) {
                return bad;
            } else {
                state_ = method;
                req.method_.push_back(input);
            }
            return indeterminate;
        case method:
            if (input == ' ') {
                state_ = uri_start;
            } else if (!isChar(input) || isCtl(input) || isTsspecial(input)) {
                return bad;
            } else {
                req.method_.push_back(input);
            }
            return indeterminate;
        case uri_start:
            if (isCtl(input) || input == ' ') {
                return bad;
            } else {
                state_ = uri;
                req.uri_.push_back(input);
            }
            return indeterminate;
        case uri:
            if (input == ' ') {
                state_ = http_version_h;
            } else if (isCtl(input)) {
                return bad;
            } else {
                req.uri_.push_back(input);
            }
            return indeterminate;
        case http_version_h:
            if (input == 'H') {
                state_ = http_version_t_1;
            } else {
                return bad;
            }
            return indeterminate;
        case http_version_t_1:
            if (input == 'T') {
                state_ = http_version_t_2;
            } else {
                return bad;
            }
            return indeterminate;
        case http_version_t_2:
            if (input == 'T') {
                state_ = http_version_p;
            } else {
                return bad;
            }
            return indeterminate;
        case http_version_p:
            if (input == 'P') {
                state_ = http_version_slash;
            } else {
                return bad;
            }
            return indeterminate;
        case http_version_slash:
            if (input == '/') {
                req.httpVersionMajor_ = 0;
                req.httpVersionMinor_ = 0;
                state_ = http_version_major_start;
            } else {
                return bad;
            }
            return indeterminate;
        case http_version_major_start:
            if (isDigit(input)) {
                req.httpVersionMajor_ = req.httpVersionMajor_ * 10 + input - '0';
                state_ = http_version_major;
            } else {
                return bad;
            }
            return indeterminate;
        case http_version_major:
            if (input == '.') {
                state_ = http_version_minor_start;
            } else if (isDigit(input) && req.httpVersionMajor_ < 100) {
                req.httpVersionMajor_ = req.httpVersionMajor_ * 10 + input - '0';
            } else {
                return bad;
            }
            return indeterminate;
        case http_version_minor_start:
            if (isDigit(input)) {
                req.httpVersionMinor_ = req.httpVersionMinor_ * 10 + input - '0';
                state_ = http_version_minor;
            } else {
                return bad;
            }
            return indeterminate;
        case http_version_minor:
            if (input == '\r') {
                state_ = expecting_newline_1;
            } else if (isDigit(input) && req.httpVersionMinor_ < 100) {
                req.httpVersionMinor_ = req.httpVersionMinor_ * 10 + input - '0';
            } else {
                return bad;
            }
            return indeterminate;
        case expecting_newline_1:
            if (input == '\n') {
                state_ = header_line_start;
                if (req.httpVersionMajor_ != 1 || req.httpVersionMinor_ > 1) {
                    return version_not_supported;
                }
                // Set default keep-alive based on HTTP version.
                // Presence of a Connection header may override this later.
                req.keepAlive_ = (req.httpVersionMinor_ > 0);
            } else {
                return bad;
            }
            return indeterminate;
        case header_line_start:
            if (input == '\r') {
                state_ = expecting_newline_3;
            } else if (input == ' ' || input == '\t') {
                // obsolete line folding is rejected, RFC 7230 3.2.4
                return bad;
            } else if (!isChar(input) || isCtl(input) || isTsspecial(input)) {
                return bad;
            } else {
                req.headers_.push_back(Header());
                req.headers_.back().name_.reserve(16);
                req.headers_.back().value_.reserve(16);
                req.headers_.back().name_.push_back(input);
                state_ = header_name;
            }
            return indeterminate;
        case header_name:
            if (input == ':') {
                state_ = space_before_header_value;
            } else if (!isChar(input) || isCtl(input) || isTsspecial(input)) {
                return bad;
            } else {
                req.headers_.back().name_.push_back(input);
            }
            return indeterminate;
        case space_before_header_value:
            // optional whitespace, "Host:example.com" is valid too
            if (input == ' ' || input == '\t') {
                return indeterminate;
            } else if (input == '\r') {
                state_ = expecting_newline_2;
                return storeHeaderValueIfNeeded(req);
            } else if (isCtl(input)) {
                return bad;
            }
            state_ = header_value;
            req.headers_.back().value_.push_back(input);
            return indeterminate;
        case header_value:
            if (input == '\r') {
                state_ = expecting_newline_2;
                return storeHeaderValueIfNeeded(req);
            } else if (isCtl(input) && input != '\t') {
                return bad;
            } else {
                req.headers_.back().value_.push_back(input);
            }
            return indeterminate;
        case expecting_newline_2:
            if (input == '\n') {
                state_ = header_line_start;
            } else {
                return bad;
            }
            return indeterminate;
        case expecting_newline_3:
            if (input == '\n') {
                return checkRequestAfterAllHeaders(req);
            }
            return bad;
        default:
            return bad;
    }
}

RequestParser::result_type RequestParser::storeHeaderValueIfNeeded(Request &req) {
    Header &h = req.headers_.back();

    // trailing whitespace is not part of the value
    while (!h.value_.empty() && (h.value_.back() == ' ' || h.value_.back() == '\t')) {
        h.value_.pop_back();
    }

    if (strcasecmp(h.name_.c_str(), "Content-Length") == 0) {
        if (h.value_.empty() || h.value_.size() > 18) {
            return bad;
        }
        size_t length = 0;
        for (char c : h.value_) {
            if (!isDigit(c)) {
                return bad;
            }
            length = length * 10 + (c - '0');
        }
        if (req.contentLength_ != std::numeric_limits<size_t>::max() &&
            req.contentLength_ != length) {
            // conflicting Content-Length headers
            return bad;
        }
        req.contentLength_ = length;
    } else if (strcasecmp(h.name_.c_str(), "Transfer-Encoding") == 0) {
        req.isChunked_ = true;
    } else if (strcasecmp(h.name_.c_str(), "Connection") == 0) {
        if (req.httpVersionMinor_ < 1) {
            // HTTP/1.0: Keep-Alive must be explicitly specified
            if (strcasecmp(h.value_.c_str(), "Keep-Alive") == 0) {
                req.keepAlive_ = true;
            }
        } else {
            // HTTP/1.1+: Keep-Alive is default unless "close" is specified
            if (strcasecmp(h.value_.c_str(), "close") == 0) {
                req.keepAlive_ = false;
            }
        }
    }
    return indeterminate;
}

RequestParser::result_type RequestParser::checkRequestAfterAllHeaders(Request &req) {
    if (req.isReadOnlyMethod()) {
        // GET and HEAD are served without reading any body
        if (req.isChunked_ || (req.contentLength_ != std::numeric_limits<size_t>::max() &&
                               req.contentLength_ != 0)) {
            return bad;
        }
    }
    // Any other method is answered before its body is read, and the
    // connection is closed after the reply.
    return good_complete;
}

}  // namespace docserve
