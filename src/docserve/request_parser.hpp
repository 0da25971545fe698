#pragma once

#include <cstddef>
#include <vector>

namespace docserve {

struct Request;

// Parser for incoming requests.
class RequestParser {
   public:
    explicit RequestParser(size_t maxHeaderSize = 8 * 1024);
    ~RequestParser() = default;

    // Reset to initial parser state.
    void reset();

    // Result of parse.
    enum result_type {
        good_complete,
        bad,
        version_not_supported,
        header_too_large,
        indeterminate
    };

    // Parse content from 'pos'. The enum return value is good_complete when a
    // complete request has been parsed, bad if the data is invalid and
    // indeterminate when more data is required. The parser keeps its state
    // between calls so a request may arrive in any number of segments.
    // On return 'pos' is just past the last consumed byte, bytes from there
    // on belong to the next request.
    result_type parse(Request &req, const std::vector<char> &content, size_t &pos);

   private:
    // Handle the next character of input.
    result_type consume(Request &req, char input);

    result_type storeHeaderValueIfNeeded(Request &req);
    result_type checkRequestAfterAllHeaders(Request &req);

    // The current state of the parser.
    enum state {
        method_start,
        method,
        uri_start,
        uri,
        http_version_h,
        http_version_t_1,
        http_version_t_2,
        http_version_p,
        http_version_slash,
        http_version_major_start,
        http_version_major,
        http_version_minor_start,
        http_version_minor,
        expecting_newline_1,
        header_line_start,
        header_name,
        space_before_header_value,
        header_value,
        expecting_newline_2,
        expecting_newline_3
    } state_;

    const size_t maxHeaderSize_;
    size_t headerBytes_ = 0;
};

}  // namespace docserve
