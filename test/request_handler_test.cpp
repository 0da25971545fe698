#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include "docserve/path_resolver.hpp"
#include "docserve/reply.hpp"
#include "docserve/request.hpp"
#include "docserve/request_handler.hpp"
#include "utils/mock_file_io.hpp"

using namespace docserve;

namespace {

const std::string docRoot = "/srv/site";

std::string resolvedPath(const std::string &relative) {
    std::filesystem::path resolved;
    PathResolver(docRoot).resolve("/" + relative, resolved);
    return resolved.string();
}

Request makeRequest(const std::string &method, const std::string &path) {
    Request req;
    req.method_ = method;
    req.uri_ = path;
    req.httpVersionMajor_ = 1;
    req.httpVersionMinor_ = 1;
    req.requestPath_ = path;
    return req;
}

struct HandlerFixture {
    explicit HandlerFixture(size_t maxContentSize = 1024)
        : handler(docRoot, maxContentSize), rep(content) {
        handler.setFileIO(&fileIO);
        handler.setErrorLogHandler([this](const std::string &text) { errorLog.push_back(text); });
    }

    MockFileIO fileIO;
    RequestHandler handler;
    std::vector<char> content;
    Reply rep;
    std::vector<std::string> errorLog;
};

}  // namespace

TEST_CASE("method policy", "[request_handler]") {
    HandlerFixture fixture;
    fixture.fileIO.createMockFile(resolvedPath("index.html"), "<h1>hi</h1>");

    SECTION("should reject POST with allowed methods") {
        fixture.handler.handleRequest(0, makeRequest("POST", "/index.html"), fixture.rep);

        REQUIRE(fixture.rep.getStatus() == Reply::method_not_allowed);
        REQUIRE(fixture.rep.getHeaderValue("Allow") == "GET, HEAD");
        REQUIRE(fixture.fileIO.getOpenFileForReadCalls() == 0);
    }
    SECTION("should reject DELETE") {
        fixture.handler.handleRequest(0, makeRequest("DELETE", "/index.html"), fixture.rep);
        REQUIRE(fixture.rep.getStatus() == Reply::method_not_allowed);
    }
    SECTION("should be case sensitive") {
        fixture.handler.handleRequest(0, makeRequest("get", "/index.html"), fixture.rep);
        REQUIRE(fixture.rep.getStatus() == Reply::method_not_allowed);
    }
}

TEST_CASE("path policy", "[request_handler]") {
    HandlerFixture fixture;

    SECTION("should forbid paths above the document root") {
        fixture.handler.handleRequest(0, makeRequest("GET", "/../../etc/passwd"), fixture.rep);

        REQUIRE(fixture.rep.getStatus() == Reply::forbidden);
        REQUIRE(fixture.fileIO.getOpenFileForReadCalls() == 0);
        const std::string body(fixture.rep.content_.begin(), fixture.rep.content_.end());
        REQUIRE(body.find("root:") == std::string::npos);
    }
    SECTION("should reject paths that are not absolute") {
        fixture.handler.handleRequest(0, makeRequest("GET", ""), fixture.rep);
        REQUIRE(fixture.rep.getStatus() == Reply::bad_request);
    }
    SECTION("should pass the resolved path to file io") {
        fixture.handler.handleRequest(0, makeRequest("GET", "/css/../js/app.js"), fixture.rep);
        REQUIRE(fixture.fileIO.getLastOpenedPath() == resolvedPath("js/app.js"));
    }
    SECTION("should reply not found for missing files") {
        fixture.handler.handleRequest(0, makeRequest("GET", "/missing.html"), fixture.rep);

        REQUIRE(fixture.rep.getStatus() == Reply::not_found);
        REQUIRE_FALSE(fixture.rep.content_.empty());
        REQUIRE(fixture.errorLog.empty());
    }
}

TEST_CASE("serve files", "[request_handler]") {
    HandlerFixture fixture;
    fixture.fileIO.createMockFile(resolvedPath("index.html"), "<h1>hi</h1>");
    fixture.fileIO.createMockFile(resolvedPath("data.unknownext"), "raw");

    SECTION("should reply with the file content") {
        fixture.handler.handleRequest(0, makeRequest("GET", "/index.html"), fixture.rep);

        REQUIRE(fixture.rep.getStatus() == Reply::ok);
        REQUIRE(fixture.rep.isReadyToSend());
        REQUIRE(std::string(fixture.rep.content_.begin(), fixture.rep.content_.end()) ==
                "<h1>hi</h1>");
        REQUIRE(fixture.rep.getHeaderValue("Content-Type") == "text/html");
        REQUIRE(fixture.rep.getHeaderValue("Content-Length") == "11");
        REQUIRE(fixture.fileIO.getNrOfOpenFiles() == 0);
    }
    SECTION("should fall back to octet-stream") {
        fixture.handler.handleRequest(0, makeRequest("GET", "/data.unknownext"), fixture.rep);
        REQUIRE(fixture.rep.getHeaderValue("Content-Type") == "application/octet-stream");
    }
    SECTION("should reply HEAD with headers only") {
        fixture.handler.handleRequest(0, makeRequest("HEAD", "/index.html"), fixture.rep);

        REQUIRE(fixture.rep.getStatus() == Reply::ok);
        REQUIRE(fixture.rep.content_.empty());
        REQUIRE(fixture.rep.getHeaderValue("Content-Type") == "text/html");
        REQUIRE(fixture.rep.getHeaderValue("Content-Length") == "11");
        REQUIRE(fixture.fileIO.getNrOfOpenFiles() == 0);
    }
}

TEST_CASE("serve large files in parts", "[request_handler]") {
    const size_t maxContentSize = 1024;
    const size_t fileSize = 4 * maxContentSize + 100;
    HandlerFixture fixture(maxContentSize);
    fixture.fileIO.createMockFile(resolvedPath("big.bin"), fileSize);
    Request req = makeRequest("GET", "/big.bin");

    fixture.handler.handleRequest(7, req, fixture.rep);

    REQUIRE(fixture.rep.getStatus() == Reply::ok);
    REQUIRE(fixture.rep.getHeaderValue("Content-Length") == std::to_string(fileSize));
    REQUIRE(fixture.rep.content_.size() == maxContentSize);
    REQUIRE(fixture.fileIO.getNrOfOpenFiles() == 1);

    std::vector<char> received(fixture.rep.content_.begin(), fixture.rep.content_.end());
    while (fixture.fileIO.getNrOfOpenFiles() > 0) {
        REQUIRE(fixture.handler.handleFileIORead(7, req, fixture.rep));
        received.insert(received.end(), fixture.rep.content_.begin(), fixture.rep.content_.end());
    }

    REQUIRE(received.size() == fileSize);
    uint32_t val = 0;
    std::memcpy(&val, &received[4 * maxContentSize], sizeof(val));
    REQUIRE(val == maxContentSize);
}

TEST_CASE("server faults", "[request_handler]") {
    HandlerFixture fixture(16);
    fixture.fileIO.createMockFile(resolvedPath("big.bin"), 64);

    SECTION("should reply 500 and log on read errors") {
        fixture.fileIO.setMockReadError();

        fixture.handler.handleRequest(0, makeRequest("GET", "/big.bin"), fixture.rep);

        REQUIRE(fixture.rep.getStatus() == Reply::internal_server_error);
        REQUIRE(fixture.fileIO.getNrOfOpenFiles() == 0);
        REQUIRE(fixture.errorLog.size() == 1);
        REQUIRE(fixture.errorLog[0].find(resolvedPath("big.bin")) != std::string::npos);
        REQUIRE(fixture.errorLog[0].find("read failed") != std::string::npos);
    }
    SECTION("should report failing reads of later parts") {
        Request req = makeRequest("GET", "/big.bin");
        fixture.handler.handleRequest(0, req, fixture.rep);
        REQUIRE(fixture.rep.getStatus() == Reply::ok);

        fixture.fileIO.setMockReadError();

        REQUIRE_FALSE(fixture.handler.handleFileIORead(0, req, fixture.rep));
        REQUIRE(fixture.fileIO.getNrOfOpenFiles() == 0);
        REQUIRE(fixture.errorLog.size() == 1);
    }
    SECTION("should turn exceptions into 500") {
        // the first request leaves its file open, the mock throws on reopen
        fixture.handler.handleRequest(3, makeRequest("GET", "/big.bin"), fixture.rep);
        REQUIRE(fixture.fileIO.getNrOfOpenFiles() == 1);

        std::vector<char> content;
        Reply rep(content);
        fixture.handler.handleRequest(3, makeRequest("GET", "/big.bin"), rep);

        REQUIRE(rep.getStatus() == Reply::internal_server_error);
        REQUIRE(fixture.fileIO.getNrOfOpenFiles() == 0);
        REQUIRE(fixture.errorLog.size() == 1);
        REQUIRE(fixture.errorLog[0].find("already opened") != std::string::npos);
    }
    SECTION("should reply not implemented without file io") {
        fixture.handler.setFileIO(nullptr);

        fixture.handler.handleRequest(0, makeRequest("GET", "/big.bin"), fixture.rep);

        REQUIRE(fixture.rep.getStatus() == Reply::not_implemented);
        REQUIRE(fixture.errorLog.size() == 1);
    }
}
