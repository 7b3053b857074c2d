#pragma once

#include "FileHttpClient.hpp"

#include <chrono>
#include <string>

struct CprFileHttpClientOptions {
    std::string baseAddress;
    std::string caCertificatePath;
    std::string certificatePath;
    std::string privateKeyPath;
    bool verifyHost = true;
    std::chrono::seconds connectTimeout{10};
};

// libcurl-backed client for the "ControlPlaneMtls" profile: mutual TLS, no redirects, streamed bodies.
class CprFileHttpClient : public FileHttpClient {
public:
    static constexpr const char* kProfileName = "ControlPlaneMtls";

    explicit CprFileHttpClient(CprFileHttpClientOptions options);

    std::string BaseAddress() const override;

    HttpStreamOutcome GetStreaming(
        const std::string& url,
        const std::map<std::string, std::string>& headers,
        HeadHandler onHead,
        BodyHandler onBody,
        const CancellationToken& token) override;

    HttpResponse PostStreaming(
        const std::string& relativeUrl,
        const std::map<std::string, std::string>& query,
        const std::map<std::string, std::string>& headers,
        uint64_t contentLength,
        BodySource source,
        const CancellationToken& token) override;

    // Absolute URLs pass through; anything else is joined to the base address.
    std::string Resolve(const std::string& url) const;

private:
    CprFileHttpClientOptions options_;
};

// Joins a base address and a path without doubling the slash.
std::string BuildUrl(const std::string& baseUrl, const std::string& path);

// Tracks the status line and Content-Length of a response as its header lines arrive.
class ResponseHeadParser {
public:
    // Returns true once the blank line that ends the header block has been seen.
    bool Feed(const std::string& line);

    const HttpResponseHead& Head() const { return head_; }

private:
    HttpResponseHead head_;
};
