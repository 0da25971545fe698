#pragma once

#include <fstream>
#include <string>
#include <unordered_map>

#include "docserve/i_file_io.hpp"
#include "docserve/path_resolver.hpp"

namespace docserve {

// IFileIO on top of the local filesystem.
class FileIO : public IFileIO {
   public:
    FileIO(const std::string &docRoot, const std::string &indexFilename);
    virtual ~FileIO() = default;

    size_t openFileForRead(const std::string &id, const Request &request, Reply &reply) override;
    int readFile(const std::string &id, const Request &request, char *buf, size_t maxSize) override;
    void closeReadFile(const std::string &id) override;

   private:
    const PathResolver resolver_;
    const std::string indexFilename_;

    // As we need to handle multiple connections that reads different
    // files, we keep a map to handle this.
    // Key is the id of each file, i.e. the connection id.
    std::unordered_map<std::string, std::ifstream> openReadFiles_;
};

}  // namespace docserve
