#pragma once

#include <string>

namespace docserve {

struct Header {
    std::string name_;
    std::string value_;
};

}  // namespace docserve
