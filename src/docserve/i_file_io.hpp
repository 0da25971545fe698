#pragma once

#include <string>

#include "docserve/reply.hpp"
#include "docserve/request.hpp"

namespace docserve {

// Read access to the files behind the document root. Each open file is
// identified by the id of the connection reading it.
class IFileIO {
   public:
    IFileIO() = default;
    virtual ~IFileIO() = default;

    // Open reply.filePath_ for reading and return its size. When the file
    // can not be served the implementation sends a reply instead (e.g. 404,
    // 301, 304) and returns 0, with no file left open.
    virtual size_t openFileForRead(const std::string &id, const Request &request, Reply &reply) = 0;

    // Read at most maxSize bytes, returns the number of bytes read or -1 on
    // I/O failure.
    virtual int readFile(const std::string &id,
                         const Request &request,
                         char *buf,
                         size_t maxSize) = 0;

    // Must be safe to call for ids without an open file.
    virtual void closeReadFile(const std::string &id) = 0;
};

}  // namespace docserve
