#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace docserve {

// Splits an absolute-form request target, e.g. "http://host:8000/a/b?x=1#f",
// into its parts. Only the parts an origin server needs are kept.
class UrlParser {
   public:
    UrlParser() : valid_(false) {}

    bool parse(const std::string &str) {
        url_ = Url();
        parse_(str);
        if (!valid_) {
            url_ = Url();
        }
        return isValid();
    }

    bool isValid() const {
        return valid_;
    }

    std::string scheme() const {
        return url_.scheme_;
    }

    std::string path() const {
        return url_.path_;
    }

    std::string query() const {
        return url_.query_;
    }

   private:
    static bool isUnreserved(char ch) {
        if (std::isalnum(static_cast<unsigned char>(ch)))
            return true;

        switch (ch) {
            case '-':
            case '.':
            case '_':
            case '~':
                return true;
        }

        return false;
    }

    void parse_(const std::string &str) {
        enum {
            scheme,
            slash_after_scheme_1,
            slash_after_scheme_2,
            hostname,
            port,
            path,
            query,
            fragment
        } state = scheme;

        valid_ = true;

        for (size_t i = 0; i < str.size() && valid_; ++i) {
            char ch = str[i];

            switch (state) {
                case scheme:
                    if (std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' ||
                        ch == '.') {
                        url_.scheme_ += static_cast<char>(std::tolower(ch));
                    } else if (ch == ':' && !url_.scheme_.empty()) {
                        state = slash_after_scheme_1;
                    } else {
                        valid_ = false;
                    }
                    break;
                case slash_after_scheme_1:
                    if (ch == '/') {
                        state = slash_after_scheme_2;
                    } else {
                        valid_ = false;
                    }
                    break;
                case slash_after_scheme_2:
                    if (ch == '/') {
                        state = hostname;
                    } else {
                        valid_ = false;
                    }
                    break;
                case hostname:
                    if (isUnreserved(ch) || ch == '%') {
                        url_.hostname_ += ch;
                    } else if (ch == ':') {
                        state = port;
                    } else if (ch == '/') {
                        url_.path_ += ch;
                        state = path;
                    } else if (ch == '?') {
                        state = query;
                    } else {
                        // userinfo and IP-literal hosts are not accepted
                        valid_ = false;
                    }
                    break;
                case port:
                    if (std::isdigit(static_cast<unsigned char>(ch)) && url_.port_.size() < 5) {
                        url_.port_ += ch;
                    } else if (ch == '/' || ch == '?') {
                        state = (ch == '/') ? path : query;
                        if (ch == '/') {
                            url_.path_ += ch;
                        }
                    } else {
                        valid_ = false;
                    }
                    break;
                case path:
                    if (ch == '#') {
                        state = fragment;
                    } else if (ch == '?') {
                        state = query;
                    } else {
                        url_.path_ += ch;
                    }
                    break;
                case query:
                    if (ch == '#') {
                        state = fragment;
                    } else {
                        url_.query_ += ch;
                    }
                    break;
                case fragment:
                    break;
            }
        }

        if (state == scheme || state == slash_after_scheme_1 || state == slash_after_scheme_2 ||
            url_.hostname_.empty()) {
            valid_ = false;
        }
        if (!url_.port_.empty()) {
            long p = std::strtol(url_.port_.c_str(), nullptr, 10);
            if (p <= 0 || p > 65535) {
                valid_ = false;
            }
        }
        if (url_.path_.empty()) {
            url_.path_ = "/";
        }
    }

    bool valid_;

    // The host and port are only checked for syntax, a request is always
    // served from the local document root.
    struct Url {
        std::string scheme_;
        std::string hostname_;
        std::string port_;
        std::string path_;
        std::string query_;
    } url_;
};

}  // namespace docserve
