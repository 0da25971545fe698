#include <cstdio>

#include "docserve/http_date.hpp"

namespace docserve {
namespace http_date {

namespace {
const char *const dayNames[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
const char *const monthNames[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool toUtc(std::time_t t, std::tm &tm) {
    return gmtime_r(&t, &tm) != nullptr;
}

bool parseNumber(const std::string &s, size_t pos, size_t len, int &out) {
    out = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (s[i] < '0' || s[i] > '9') {
            return false;
        }
        out = out * 10 + (s[i] - '0');
    }
    return true;
}
}  // namespace

std::string format(std::time_t t) {
    std::tm tm{};
    if (!toUtc(t, tm)) {
        return "";
    }
    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  dayNames[tm.tm_wday],
                  tm.tm_mday,
                  monthNames[tm.tm_mon],
                  tm.tm_year + 1900,
                  tm.tm_hour,
                  tm.tm_min,
                  tm.tm_sec);
    return buf;
}

bool parse(const std::string &str, std::time_t &t) {
    // 0         1         2
    // 01234567890123456789012345678
    // Sun, 06 Nov 1994 08:49:37 GMT
    if (str.size() != 29 || str[3] != ',' || str[4] != ' ' || str[7] != ' ' || str[11] != ' ' ||
        str[16] != ' ' || str[19] != ':' || str[22] != ':' || str.compare(25, 4, " GMT") != 0) {
        return false;
    }

    std::tm tm{};
    int month = -1;
    for (int i = 0; i < 12; ++i) {
        if (str.compare(8, 3, monthNames[i]) == 0) {
            month = i;
            break;
        }
    }
    int year = 0;
    if (month < 0 || !parseNumber(str, 5, 2, tm.tm_mday) || !parseNumber(str, 12, 4, year) ||
        !parseNumber(str, 17, 2, tm.tm_hour) || !parseNumber(str, 20, 2, tm.tm_min) ||
        !parseNumber(str, 23, 2, tm.tm_sec)) {
        return false;
    }
    if (tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 || tm.tm_min > 59 ||
        tm.tm_sec > 60) {
        return false;
    }
    tm.tm_mon = month;
    tm.tm_year = year - 1900;

    t = timegm(&tm);
    return t != static_cast<std::time_t>(-1);
}

std::string formatLogTime(std::time_t t) {
    std::tm tm{};
    if (!toUtc(t, tm)) {
        return "-";
    }
    char buf[64];
    std::snprintf(buf,
                  sizeof(buf),
                  "%02d/%s/%04d:%02d:%02d:%02d +0000",
                  tm.tm_mday,
                  monthNames[tm.tm_mon],
                  tm.tm_year + 1900,
                  tm.tm_hour,
                  tm.tm_min,
                  tm.tm_sec);
    return buf;
}

}  // namespace http_date
}  // namespace docserve
