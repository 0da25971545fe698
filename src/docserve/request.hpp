#pragma once

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <vector>

#include "docserve/header.hpp"

namespace docserve {

// A request received from a client.
struct Request {
    friend class Connection;
    friend class RequestParser;
    friend class RequestDecoder;

    Request() = default;

    std::string method_;
    std::string uri_;
    int httpVersionMajor_ = 0;
    int httpVersionMinor_ = 0;
    std::vector<Header> headers_;
    bool keepAlive_ = true;

    // Percent decoded uri_ without the query string.
    std::string requestPath_;

    // Raw query string, without the leading '?'.
    std::string query_;

    // convenience functions
    // case insensitive
    std::string getHeaderValue(const std::string &name) const {
        auto it = std::find_if(headers_.begin(), headers_.end(), [&](const Header &h) {
            return iequals(h.name_, name);
        });
        if (it != headers_.end()) {
            return it->value_;
        }
        return "";
    }

    bool hasHeader(const std::string &name) const {
        return std::any_of(headers_.begin(), headers_.end(), [&](const Header &h) {
            return iequals(h.name_, name);
        });
    }

    bool isReadOnlyMethod() const {
        return method_ == "GET" || method_ == "HEAD";
    }

    // e.g. "GET /index.html HTTP/1.1", used for access logging
    std::string requestLine() const {
        if (method_.empty()) {
            return "-";
        }
        return method_ + " " + uri_ + " HTTP/" + std::to_string(httpVersionMajor_) + "." +
               std::to_string(httpVersionMinor_);
    }

    static bool iequals(const std::string &a, const std::string &b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), ichar_equals);
    }

   private:
    void reset() {
        method_.clear();
        uri_.clear();
        httpVersionMajor_ = 0;
        httpVersionMinor_ = 0;
        headers_.clear();
        keepAlive_ = true;
        requestPath_.clear();
        query_.clear();
        contentLength_ = std::numeric_limits<size_t>::max();
        isChunked_ = false;
    }

    static bool ichar_equals(char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    }

    size_t contentLength_ = std::numeric_limits<size_t>::max();
    bool isChunked_ = false;
};

}  // namespace docserve
