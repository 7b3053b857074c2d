#include "CprFileHttpClient.hpp"

#include <cpr/cpr.h>
#include <cpr/ssl_options.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>

namespace {
constexpr int kLowSpeedBytesPerSecond = 1000;
constexpr int kLowSpeedTimeoutSeconds = 30;

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

cpr::SslOptions BuildSslOptions(const CprFileHttpClientOptions& options) {
    cpr::SslOptions ssl = cpr::Ssl(cpr::ssl::VerifyPeer{true}, cpr::ssl::VerifyHost{options.verifyHost});
    if (!options.caCertificatePath.empty()) {
        ssl.SetOption(cpr::ssl::CaInfo{std::string(options.caCertificatePath)});
    }
    if (!options.certificatePath.empty()) {
        ssl.SetOption(cpr::ssl::CertFile{std::string(options.certificatePath)});
        ssl.SetOption(cpr::ssl::KeyFile{std::string(options.privateKeyPath)});
    }
    return ssl;
}

cpr::Header BuildHeaders(const std::map<std::string, std::string>& headers) {
    cpr::Header result;
    for (const auto& header : headers) {
        result[header.first] = header.second;
    }
    return result;
}

} // namespace

bool ResponseHeadParser::Feed(const std::string& line) {
    const std::string trimmed = Trim(line);
    if (trimmed.rfind("HTTP/", 0) == 0) {
        head_ = HttpResponseHead{};
        const auto space = trimmed.find(' ');
        if (space != std::string::npos) {
            head_.statusCode = std::strtol(trimmed.c_str() + space + 1, nullptr, 10);
        }
        return false;
    }
    if (trimmed.empty()) {
        return head_.statusCode != 0;
    }

    const auto colon = trimmed.find(':');
    if (colon != std::string::npos && ToLower(trimmed.substr(0, colon)) == "content-length") {
        const std::string value = Trim(trimmed.substr(colon + 1));
        if (!value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
            head_.contentLength = std::stoull(value);
        }
    }
    return false;
}

std::string BuildUrl(const std::string& baseUrl, const std::string& path) {
    if (baseUrl.empty()) {
        return path;
    }

    const std::string base = baseUrl.back() == '/' ? baseUrl.substr(0, baseUrl.size() - 1) : baseUrl;
    if (path.empty()) {
        return base;
    }
    return path.front() == '/' ? base + path : base + "/" + path;
}

CprFileHttpClient::CprFileHttpClient(CprFileHttpClientOptions options)
    : options_(std::move(options)) {}

std::string CprFileHttpClient::BaseAddress() const {
    return options_.baseAddress;
}

HttpStreamOutcome CprFileHttpClient::GetStreaming(
    const std::string& url,
    const std::map<std::string, std::string>& headers,
    HeadHandler onHead,
    BodyHandler onBody,
    const CancellationToken& token) {
    HttpStreamOutcome outcome;
    ResponseHeadParser parser;
    bool headDelivered = false;

    cpr::Session session;
    session.SetUrl(cpr::Url{Resolve(url)});
    session.SetHeader(BuildHeaders(headers));
    session.SetSslOptions(BuildSslOptions(options_));
    session.SetRedirect(cpr::Redirect{false});
    session.SetConnectTimeout(cpr::ConnectTimeout{options_.connectTimeout});
    session.SetLowSpeed(cpr::LowSpeed{kLowSpeedBytesPerSecond, kLowSpeedTimeoutSeconds});

    session.SetHeaderCallback(cpr::HeaderCallback{[&](auto header, intptr_t) -> bool {
        if (parser.Feed(std::string(header.data(), header.size())) && !headDelivered) {
            headDelivered = true;
            outcome.statusCode = parser.Head().statusCode;
            if (!onHead(parser.Head())) {
                outcome.aborted = true;
                return false;
            }
        }
        return true;
    }});
    session.SetWriteCallback(cpr::WriteCallback{[&](auto data, intptr_t) -> bool {
        if (outcome.aborted) {
            return false;
        }
        if (!onBody(data.data(), data.size())) {
            outcome.aborted = true;
            return false;
        }
        return true;
    }});

    session.SetProgressCallback(cpr::ProgressCallback{
        [&](cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) -> bool {
            if (token.IsCancellationRequested()) {
                outcome.aborted = true;
                return false;
            }
            return true;
        }});

    const cpr::Response response = session.Get();
    if (response.status_code != 0) {
        outcome.statusCode = response.status_code;
    }
    if (!outcome.aborted && response.error.code != cpr::ErrorCode::OK) {
        outcome.error = response.error.message;
    }
    return outcome;
}

HttpResponse CprFileHttpClient::PostStreaming(
    const std::string& relativeUrl,
    const std::map<std::string, std::string>& query,
    const std::map<std::string, std::string>& headers,
    uint64_t contentLength,
    BodySource source,
    const CancellationToken& token) {
    cpr::Parameters parameters;
    for (const auto& entry : query) {
        parameters.Add({entry.first, entry.second});
    }

    std::map<std::string, std::string> requestHeaders = headers;
    requestHeaders["Content-Type"] = "application/octet-stream";

    cpr::Session session;
    session.SetUrl(cpr::Url{Resolve(relativeUrl)});
    session.SetParameters(parameters);
    session.SetHeader(BuildHeaders(requestHeaders));
    session.SetSslOptions(BuildSslOptions(options_));
    session.SetRedirect(cpr::Redirect{false});
    session.SetConnectTimeout(cpr::ConnectTimeout{options_.connectTimeout});
    session.SetLowSpeed(cpr::LowSpeed{kLowSpeedBytesPerSecond, kLowSpeedTimeoutSeconds});

    bool aborted = false;
    session.SetReadCallback(cpr::ReadCallback{
        static_cast<cpr::cpr_off_t>(contentLength),
        [&source, &aborted](char* buffer, size_t& size, intptr_t) -> bool {
            std::size_t written = 0;
            if (!source(buffer, size, written)) {
                aborted = true;
                return false;
            }
            size = written;
            return true;
        }});
    session.SetProgressCallback(cpr::ProgressCallback{
        [&](cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, cpr::cpr_off_t, intptr_t) -> bool {
            if (token.IsCancellationRequested()) {
                aborted = true;
                return false;
            }
            return true;
        }});

    const cpr::Response response = session.Post();

    HttpResponse result;
    result.aborted = aborted;
    result.statusCode = response.status_code;
    result.body = response.text;
    if (!aborted && response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message;
    }
    return result;
}

std::string CprFileHttpClient::Resolve(const std::string& url) const {
    if (url.find("://") != std::string::npos) {
        return url;
    }
    return BuildUrl(options_.baseAddress, url);
}
