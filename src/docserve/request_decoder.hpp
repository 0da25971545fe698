#pragma once

#include <string>

#include "docserve/request.hpp"

namespace docserve {

// Turns the raw request target of a parsed request into requestPath_ and
// query_. Returns false when the target can not be served from a document
// root at all (not origin-form or absolute-form, broken escapes, NUL bytes).
class RequestDecoder {
   public:
    RequestDecoder() = default;
    virtual ~RequestDecoder() = default;

    bool decodeRequest(Request &req);

    // Percent decode 'in' into 'out'. '+' is kept as is, as it carries no
    // special meaning in a path.
    static bool urlDecode(const std::string &in, std::string &out);
};

}  // namespace docserve
