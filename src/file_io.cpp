#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>

#include "docserve/file_io.hpp"
#include "docserve/http_date.hpp"
#include "docserve/mime_types.hpp"

namespace fs = std::filesystem;

namespace docserve {

namespace {
bool isNotFound(const std::error_code &ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

// The request target as sent, up to the query, so percent escapes survive
// the redirect.
std::string redirectLocation(const Request &req) {
    std::string location;
    if (!req.uri_.empty() && req.uri_[0] == '/') {
        location = req.uri_.substr(0, req.uri_.find_first_of("?#"));
    } else {
        location = req.requestPath_;
    }
    location += '/';
    if (!req.query_.empty()) {
        location += "?" + req.query_;
    }
    return location;
}

void sendServerError(const Request &req, Reply &reply, const std::string &detail) {
    reply.stockReply(req, Reply::internal_server_error);
    reply.errorDetail_ = detail;
}
}  // namespace

FileIO::FileIO(const std::string &docRoot, const std::string &indexFilename)
    : resolver_(docRoot), indexFilename_(indexFilename) {}

size_t FileIO::openFileForRead(const std::string &id, const Request &req, Reply &reply) {
    fs::path fullPath(reply.filePath_);

    std::error_code ec;
    fs::file_status st = fs::status(fullPath, ec);
    if (st.type() == fs::file_type::not_found || isNotFound(ec)) {
        reply.stockReply(req, Reply::not_found);
        return 0;
    } else if (ec) {
        sendServerError(req, reply, ec.message());
        return 0;
    }

    if (fs::is_directory(st)) {
        if (!req.requestPath_.empty() && req.requestPath_.back() != '/') {
            reply.redirect(req, redirectLocation(req));
            return 0;
        }

        fullPath /= indexFilename_;
        reply.filePath_ = fullPath.string();
        reply.fileExtension_ = mime_types::extensionOf(indexFilename_);

        st = fs::status(fullPath, ec);
        if (st.type() == fs::file_type::not_found || isNotFound(ec) || fs::is_directory(st)) {
            // no directory listings
            reply.stockReply(req, Reply::not_found);
            return 0;
        } else if (ec) {
            sendServerError(req, reply, ec.message());
            return 0;
        }
    } else if (!req.requestPath_.empty() && req.requestPath_.back() == '/') {
        // "/a.txt/" names a directory that does not exist
        reply.stockReply(req, Reply::not_found);
        return 0;
    }

    if (!fs::is_regular_file(st)) {
        reply.stockReply(req, Reply::forbidden);
        return 0;
    }

    // Symlinks are followed, but must not lead out of the document root.
    fs::path realPath = fs::canonical(fullPath, ec);
    if (ec) {
        sendServerError(req, reply, ec.message());
        return 0;
    }
    if (!resolver_.isInsideRoot(realPath)) {
        reply.stockReply(req, Reply::forbidden);
        return 0;
    }

    struct stat sb;
    if (::stat(realPath.c_str(), &sb) != 0) {
        sendServerError(req, reply, std::strerror(errno));
        return 0;
    }
    const std::string lastModified = http_date::format(sb.st_mtime);

    // Check for If-Modified-Since header, ignored when If-None-Match is
    // present as we do not generate ETags.
    const std::string ifModifiedSince = req.getHeaderValue("If-Modified-Since");
    std::time_t since = 0;
    if (!ifModifiedSince.empty() && !req.hasHeader("If-None-Match") &&
        http_date::parse(ifModifiedSince, since) && sb.st_mtime <= since) {
        reply.addHeader("Last-Modified", lastModified);
        reply.send(Reply::not_modified);
        return 0;
    }

    // Open file for reading
    std::ifstream &is = openReadFiles_[id];
    is.close();
    is.clear();
    errno = 0;
    is.open(realPath, std::ios::in | std::ios::binary);
    if (!is.is_open()) {
        int err = errno;
        openReadFiles_.erase(id);
        sendServerError(
            req, reply, err != 0 ? std::strerror(err) : std::string("could not open file"));
        return 0;
    }

    reply.addHeader("Last-Modified", lastModified);
    return static_cast<size_t>(sb.st_size);
}

int FileIO::readFile(const std::string &id, const Request &, char *buf, size_t maxSize) {
    auto it = openReadFiles_.find(id);
    if (it == openReadFiles_.end()) {
        return -1;
    }
    it->second.read(buf, maxSize);
    if (it->second.bad()) {
        return -1;
    }
    return static_cast<int>(it->second.gcount());
}

void FileIO::closeReadFile(const std::string &id) {
    auto it = openReadFiles_.find(id);
    if (it != openReadFiles_.end()) {
        it->second.close();
        openReadFiles_.erase(it);
    }
}

}  // namespace docserve
