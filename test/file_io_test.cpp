#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <numeric>
#include <string>
#include <vector>

#include "docserve/file_io.hpp"
#include "docserve/http_date.hpp"
#include "docserve/path_resolver.hpp"
#include "utils/temp_doc_root.hpp"

using namespace docserve;
namespace fs = std::filesystem;

namespace {

struct FileIOFixture {
    FileIOFixture() : fileIO(docRoot.rootString(), "index.html"), rep(content) {}

    // Prepare 'req' and 'rep' the way the request handler does.
    size_t open(const std::string &id, const std::string &path, const std::string &query = "") {
        req.method_ = "GET";
        req.uri_ = path + (query.empty() ? "" : "?" + query);
        req.httpVersionMajor_ = 1;
        req.httpVersionMinor_ = 1;
        req.requestPath_ = path;
        req.query_ = query;

        fs::path resolved;
        PathResolver(docRoot.rootString()).resolve(path, resolved);
        rep.filePath_ = resolved.string();
        return fileIO.openFileForRead(id, req, rep);
    }

    std::string readAll(const std::string &id) {
        std::string data;
        char buf[16];
        int n;
        while ((n = fileIO.readFile(id, req, buf, sizeof(buf))) > 0) {
            data.append(buf, n);
        }
        return data;
    }

    TempDocRoot docRoot;
    FileIO fileIO;
    Request req;
    std::vector<char> content;
    Reply rep;
};

}  // namespace

TEST_CASE("open and read files", "[file_io]") {
    FileIOFixture fixture;
    std::vector<uint32_t> arr(100);
    std::iota(arr.begin(), arr.end(), 0);
    fixture.docRoot.write("testfile.bin",
                          std::string(reinterpret_cast<const char *>(arr.data()),
                                      arr.size() * sizeof(uint32_t)));

    SECTION("should provide correct size") {
        size_t fileSize = fixture.open("0", "/testfile.bin");
        REQUIRE(fileSize == arr.size() * sizeof(uint32_t));
        REQUIRE_FALSE(fixture.rep.isReadyToSend());
        REQUIRE_FALSE(fixture.rep.getHeaderValue("Last-Modified").empty());
    }
    SECTION("should read chunks") {
        fixture.open("0", "/testfile.bin");
        std::vector<uint32_t> readData(10);

        fixture.fileIO.readFile("0", fixture.req, (char *)readData.data(), readData.size() * 4);
        std::vector<uint32_t> expected = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
        REQUIRE(readData == expected);

        fixture.fileIO.readFile("0", fixture.req, (char *)readData.data(), readData.size() * 4);
        expected = {10, 11, 12, 13, 14, 15, 16, 17, 18, 19};
        REQUIRE(readData == expected);
    }
    SECTION("should allow parallell reads") {
        fixture.open("0", "/testfile.bin");
        std::vector<uint32_t> readData(10);
        fixture.fileIO.readFile("0", fixture.req, (char *)readData.data(), readData.size() * 4);

        fixture.open("1", "/testfile.bin");

        fixture.fileIO.readFile("0", fixture.req, (char *)readData.data(), readData.size() * 4);
        std::vector<uint32_t> expected = {10, 11, 12, 13, 14, 15, 16, 17, 18, 19};
        REQUIRE(readData == expected);

        fixture.fileIO.readFile("1", fixture.req, (char *)readData.data(), readData.size() * 4);
        expected = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
        REQUIRE(readData == expected);
    }
    SECTION("should close file idempotent") {
        fixture.open("0", "/testfile.bin");
        fixture.fileIO.closeReadFile("0");
        fixture.fileIO.closeReadFile("0");
        fixture.fileIO.closeReadFile("0");
        char c;
        REQUIRE(fixture.fileIO.readFile("0", fixture.req, &c, 1) == -1);
    }
    SECTION("should return zero at end of file") {
        fixture.open("0", "/testfile.bin");
        std::vector<char> buf(1000);
        REQUIRE(fixture.fileIO.readFile("0", fixture.req, buf.data(), buf.size()) == 400);
        REQUIRE(fixture.fileIO.readFile("0", fixture.req, buf.data(), buf.size()) == 0);
    }
}

TEST_CASE("files that can not be served", "[file_io]") {
    FileIOFixture fixture;

    SECTION("should reply not found") {
        REQUIRE(fixture.open("0", "/missing.txt") == 0);
        REQUIRE(fixture.rep.getStatus() == Reply::not_found);
        REQUIRE(fixture.rep.isReadyToSend());
    }
    SECTION("should reply not found below a file") {
        fixture.docRoot.write("a.txt", "a");
        fixture.open("0", "/a.txt/b.txt");
        REQUIRE(fixture.rep.getStatus() == Reply::not_found);
    }
    SECTION("should reply not found for a file addressed as directory") {
        fixture.docRoot.write("a.txt", "a");
        REQUIRE(fixture.open("0", "/a.txt/") == 0);
        REQUIRE(fixture.rep.getStatus() == Reply::not_found);
    }
    SECTION("should reply server error for a symlink loop") {
        fs::create_symlink("loop.txt", fixture.docRoot.root() / "loop.txt");

        REQUIRE(fixture.open("0", "/loop.txt") == 0);
        REQUIRE(fixture.rep.getStatus() == Reply::internal_server_error);
        REQUIRE_FALSE(fixture.rep.errorDetail_.empty());
    }
    SECTION("should forbid symlinks out of the root") {
        fs::path secret = fixture.docRoot.writeOutside("secret.txt", "top secret");
        fs::create_symlink(secret, fixture.docRoot.root() / "link.txt");

        REQUIRE(fixture.open("0", "/link.txt") == 0);
        REQUIRE(fixture.rep.getStatus() == Reply::forbidden);
        const std::string body(fixture.rep.content_.begin(), fixture.rep.content_.end());
        REQUIRE(body.find("top secret") == std::string::npos);
    }
    SECTION("should follow symlinks inside the root") {
        fixture.docRoot.write("real.txt", "real");
        fs::create_symlink(fixture.docRoot.root() / "real.txt", fixture.docRoot.root() / "alias.txt");

        REQUIRE(fixture.open("0", "/alias.txt") == 4);
        REQUIRE(fixture.readAll("0") == "real");
    }
}

TEST_CASE("directories", "[file_io]") {
    FileIOFixture fixture;
    fixture.docRoot.write("docs/index.html", "<h1>docs</h1>");
    fixture.docRoot.mkdir("empty");

    SECTION("should redirect without trailing slash") {
        REQUIRE(fixture.open("0", "/docs") == 0);
        REQUIRE(fixture.rep.getStatus() == Reply::moved_permanently);
        REQUIRE(fixture.rep.getHeaderValue("Location") == "/docs/");
    }
    SECTION("should keep the query in the redirect") {
        fixture.open("0", "/docs", "page=2");
        REQUIRE(fixture.rep.getHeaderValue("Location") == "/docs/?page=2");
    }
    SECTION("should serve the index file") {
        REQUIRE(fixture.open("0", "/docs/") == 13);
        REQUIRE(fixture.rep.fileExtension_ == "html");
        REQUIRE(fixture.readAll("0") == "<h1>docs</h1>");
    }
    SECTION("should reply not found without index file") {
        fixture.open("0", "/empty/");
        REQUIRE(fixture.rep.getStatus() == Reply::not_found);
    }
}

TEST_CASE("conditional requests", "[file_io]") {
    FileIOFixture fixture;
    fs::path file = fixture.docRoot.write("page.html", "<p>page</p>");
    const std::time_t mtime = 1000000000;
    REQUIRE(fixture.open("0", "/page.html") == 11);
    const std::string lastModified = fixture.rep.getHeaderValue("Last-Modified");
    fixture.fileIO.closeReadFile("0");

    std::vector<char> content;
    Reply rep(content);
    Request req = fixture.req;
    rep.filePath_ = fixture.rep.filePath_;

    SECTION("should reply not modified for the same date") {
        req.headers_.push_back({"If-Modified-Since", lastModified});

        REQUIRE(fixture.fileIO.openFileForRead("0", req, rep) == 0);
        REQUIRE(rep.getStatus() == Reply::not_modified);
        REQUIRE(rep.content_.empty());
        REQUIRE(rep.getHeaderValue("Last-Modified") == lastModified);
    }
    SECTION("should serve the file when modified since") {
        req.headers_.push_back({"If-Modified-Since", http_date::format(mtime)});

        REQUIRE(fixture.fileIO.openFileForRead("0", req, rep) == 11);
        REQUIRE_FALSE(rep.isReadyToSend());
    }
    SECTION("should ignore invalid dates") {
        req.headers_.push_back({"If-Modified-Since", "yesterday"});
        REQUIRE(fixture.fileIO.openFileForRead("0", req, rep) == 11);
    }
    SECTION("should ignore the date with If-None-Match") {
        req.headers_.push_back({"If-Modified-Since", lastModified});
        req.headers_.push_back({"If-None-Match", "\"abc\""});
        REQUIRE(fixture.fileIO.openFileForRead("0", req, rep) == 11);
    }
}
