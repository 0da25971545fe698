#pragma once

namespace docserve {

// Check if a byte is an HTTP character.
inline bool isChar(int c) {
    return c >= 0 && c <= 127;
}

// Check if a byte is an HTTP control character.
inline bool isCtl(int c) {
    return (c >= 0 && c <= 31) || (c == 127);
}

// Check if a byte is defined as an HTTP tspecial character.
inline bool isTsspecial(int c) {
    switch (c) {
        case '(':
        case ')':
        case '<':
        case '>':
        case '@':
        case ',':
        case ';':
        case ':':
        case '\\':
        case '"':
        case '/':
        case '[':
        case ']':
        case '?':
        case '=':
        case '{':
        case '}':
        case ' ':
        case '\t':
            return true;
        default:
            return false;
    }
}

// Check if a byte is a digit.
inline bool isDigit(int c) {
    return c >= '0' && c <= '9';
}

inline int hexValue(int c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace docserve
