#pragma once

#include "CancellationToken.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

struct HttpResponseHead {
    long statusCode = 0;
    std::optional<uint64_t> contentLength;
};

struct HttpStreamOutcome {
    long statusCode = 0;
    // True when a handler returned false and the transfer stopped early.
    bool aborted = false;
    std::string error;
};

struct HttpResponse {
    long statusCode = 0;
    bool aborted = false;
    std::string body;
    std::string error;
};

// Streaming HTTP client used by the transfer engine. Implementations never follow redirects.
class FileHttpClient {
public:
    // Called once, after the headers of a response arrive. Return false to abort.
    using HeadHandler = std::function<bool(const HttpResponseHead& head)>;
    // Called for each received slice of the body. Return false to abort.
    using BodyHandler = std::function<bool(const char* data, std::size_t size)>;
    // Fills up to `capacity` bytes and sets `written`; written == 0 ends the body. Return false to abort.
    using BodySource = std::function<bool(char* buffer, std::size_t capacity, std::size_t& written)>;

    virtual ~FileHttpClient() = default;

    // Empty when the profile has no base address.
    virtual std::string BaseAddress() const = 0;

    // `url` is absolute or relative to BaseAddress(). The request is abandoned, with `aborted`
    // set, soon after the token fires even while the server is silent.
    virtual HttpStreamOutcome GetStreaming(
        const std::string& url,
        const std::map<std::string, std::string>& headers,
        HeadHandler onHead,
        BodyHandler onBody,
        const CancellationToken& token) = 0;

    virtual HttpResponse PostStreaming(
        const std::string& relativeUrl,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers,
        uint64_t contentLength,
        BodySource source,
        const CancellationToken& token) = 0;
};

using FileHttpClientFactory = std::function<std::unique_ptr<FileHttpClient>(const std::string& profile)>;
