#include "docserve/parse_common.hpp"
#include "docserve/request_decoder.hpp"
#include "docserve/url_parser.hpp"

namespace docserve {

bool RequestDecoder::decodeRequest(Request &req) {
    std::string target;
    std::string query;

    if (!req.uri_.empty() && req.uri_[0] == '/') {
        // origin-form, strip fragment (not expected, but harmless) and query
        target = req.uri_.substr(0, req.uri_.find('#'));
        size_t pos = target.find('?');
        if (pos != std::string::npos) {
            query = target.substr(pos + 1);
            target.erase(pos);
        }
    } else {
        // absolute-form, as sent to proxies
        UrlParser url;
        if (!url.parse(req.uri_) || (url.scheme() != "http" && url.scheme() != "https")) {
            return false;
        }
        target = url.path();
        query = url.query();
    }

    req.requestPath_.clear();
    if (!urlDecode(target, req.requestPath_)) {
        return false;
    }

    // request path must be absolute
    if (req.requestPath_.empty() || req.requestPath_[0] != '/') {
        return false;
    }

    req.query_ = query;
    return true;
}

bool RequestDecoder::urlDecode(const std::string &in, std::string &out) {
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size()) {
                return false;
            }
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            char decoded = static_cast<char>(hi * 16 + lo);
            if (decoded == '\0') {
                return false;
            }
            out += decoded;
            i += 2;
        } else {
            out += c;
        }
    }
    return true;
}

}  // namespace docserve
