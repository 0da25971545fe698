#pragma once

#include <ctime>
#include <string>

namespace docserve {
namespace http_date {

// "Sun, 06 Nov 1994 08:49:37 GMT" (RFC 7231 IMF-fixdate)
std::string format(std::time_t t);

// Accepts IMF-fixdate only. Returns false for anything else, in which case
// callers treat the header as absent.
bool parse(const std::string &str, std::time_t &t);

// "06/Nov/1994:08:49:37 +0000", as used in access log lines.
std::string formatLogTime(std::time_t t);

}  // namespace http_date
}  // namespace docserve
