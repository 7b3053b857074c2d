#include "CprFileHttpClient.hpp"

#include <iostream>
#include <optional>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    if (BuildUrl("https://files.example/", "/api/v1/files") != "https://files.example/api/v1/files"
        || BuildUrl("https://files.example", "api/v1/files") != "https://files.example/api/v1/files") {
        return Fail("Base and path must be joined by exactly one slash.");
    }
    if (BuildUrl("https://files.example/", "") != "https://files.example" || BuildUrl("", "/blob") != "/blob") {
        return Fail("Empty base or path not handled.");
    }

    CprFileHttpClientOptions options;
    options.baseAddress = "https://control.example:5001/";
    const CprFileHttpClient client(options);
    if (client.BaseAddress() != "https://control.example:5001/") {
        return Fail("Base address not kept.");
    }
    if (client.Resolve("files/abc") != "https://control.example:5001/files/abc") {
        return Fail("Relative URLs must resolve against the base address.");
    }
    if (client.Resolve("https://cdn.example/blob") != "https://cdn.example/blob") {
        return Fail("Absolute URLs must pass through unchanged.");
    }

    ResponseHeadParser parser;
    if (parser.Feed("HTTP/1.1 200 OK\r\n") || parser.Feed("Content-Type: application/octet-stream\r\n")
        || parser.Feed("content-LENGTH:  1024 \r\n")) {
        return Fail("The head is complete only at the blank line.");
    }
    if (!parser.Feed("\r\n") || parser.Head().statusCode != 200
        || parser.Head().contentLength != std::optional<uint64_t>(1024)) {
        return Fail("Status or Content-Length not parsed.");
    }

    ResponseHeadParser interim;
    interim.Feed("HTTP/1.1 100 Continue\r\n");
    interim.Feed("\r\n");
    interim.Feed("HTTP/1.1 404 Not Found\r\n");
    interim.Feed("Content-Length: -5\r\n");
    if (!interim.Feed("\r\n") || interim.Head().statusCode != 404 || interim.Head().contentLength) {
        return Fail("A later status line must reset the head, and a malformed length is ignored.");
    }

    ResponseHeadParser empty;
    if (empty.Feed("\r\n")) {
        return Fail("A blank line before any status line does not end a head.");
    }

    return 0;
}
