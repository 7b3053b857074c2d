#include "WebSocketConnection.hpp"

#include "AgentOptions.hpp"
#include "CertificateStore.hpp"
#include "HubProtocol.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <deque>
#include <functional>
#include <iostream>
#include <utility>

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

namespace {
using SteadyClock = std::chrono::steady_clock;

constexpr auto kPollSlice = std::chrono::milliseconds(50);
constexpr auto kMaxKeepAliveTick = std::chrono::milliseconds(1000);
constexpr auto kStopGracePeriod = std::chrono::seconds(2);
constexpr const char* kUserAgent = "fleetlink-agent";

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::unique_ptr<ssl::context> BuildTlsContext(const DuplexConnectionOptions& options, const std::string& host) {
    auto tls = std::make_unique<ssl::context>(ssl::context::tls_client);
    tls->set_options(
        ssl::context::default_workarounds
        | ssl::context::no_sslv2
        | ssl::context::no_sslv3
        | ssl::context::no_tlsv1
        | ssl::context::no_tlsv1_1);

    beast::error_code error;
    if (!options.caCertificatePath.empty()) {
        tls->load_verify_file(options.caCertificatePath, error);
    } else {
        tls->set_default_verify_paths(error);
    }
    if (error) {
        throw TransportError("Unable to load trust anchors: " + error.message());
    }

    tls->set_verify_mode(ssl::verify_peer);
    if (options.verifyHost) {
        tls->set_verify_callback(ssl::host_name_verification(host));
    }

    if (options.clientCertificate != nullptr) {
        // The context takes its own references, so the certificate object may be released later.
        if (SSL_CTX_use_certificate(tls->native_handle(), options.clientCertificate->Certificate()) != 1
            || SSL_CTX_use_PrivateKey(tls->native_handle(), options.clientCertificate->PrivateKey()) != 1) {
            throw TransportError("Unable to attach the client certificate to the TLS context");
        }
    }

    return tls;
}
} // namespace

struct WebSocketConnection::Session {
    explicit Session(ssl::context& tls)
        : stream(ioc, tls),
          resolver(ioc),
          keepAlive(ioc) {}

    net::io_context ioc;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> stream;
    tcp::resolver resolver;
    net::steady_timer keepAlive;
    beast::flat_buffer readBuffer;
    std::deque<std::string> writeQueue;
    std::string leftover;

    SteadyClock::time_point lastReceived = SteadyClock::now();
    SteadyClock::time_point lastSent = SteadyClock::now();
    bool ended = false;
    bool serverClosed = false;
    std::string endReason;
};

namespace {
using StepCallback = std::function<void(beast::error_code)>;

// Drives one asynchronous handshake step on the caller's thread, aborting the socket as soon as
// the token fires.
template <typename SessionT, typename Initiate>
void RunStep(SessionT& session, const CancellationToken& token, const std::string& step, Initiate initiate) {
    bool done = false;
    beast::error_code result;
    session.ioc.restart();
    initiate(StepCallback([&done, &result](beast::error_code ec) {
        result = ec;
        done = true;
    }));

    while (!done) {
        if (token.IsCancellationRequested()) {
            beast::error_code ignored;
            session.resolver.cancel();
            beast::get_lowest_layer(session.stream).socket().close(ignored);
            session.ioc.restart();
            session.ioc.run();
            token.ThrowIfCancelled();
        }
        session.ioc.run_for(kPollSlice);
        if (session.ioc.stopped() && !done) {
            session.ioc.restart();
        }
    }

    if (result) {
        throw TransportError(step + " failed: " + result.message());
    }
}
} // namespace

std::optional<WebSocketEndpoint> ParseWebSocketUrl(const std::string& url) {
    constexpr const char* kScheme = "wss://";
    if (ToLower(url.substr(0, 6)) != kScheme) {
        return std::nullopt;
    }

    const std::string rest = url.substr(6);
    const auto slash = rest.find('/');
    const std::string authority = rest.substr(0, slash);
    if (authority.empty() || authority.find('@') != std::string::npos) {
        return std::nullopt;
    }

    WebSocketEndpoint endpoint;
    endpoint.target = slash == std::string::npos ? "/" : rest.substr(slash);

    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        endpoint.host = authority.substr(1, close - 1);
        const std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':' || tail.size() == 1) {
                return std::nullopt;
            }
            endpoint.port = tail.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            endpoint.host = authority.substr(0, colon);
            endpoint.port = authority.substr(colon + 1);
            if (endpoint.port.empty()) {
                return std::nullopt;
            }
        } else {
            endpoint.host = authority;
        }
    }

    if (endpoint.host.empty()) {
        return std::nullopt;
    }
    if (endpoint.port.empty()) {
        endpoint.port = "443";
    }
    if (!std::all_of(endpoint.port.begin(), endpoint.port.end(), [](unsigned char ch) { return std::isdigit(ch); })) {
        return std::nullopt;
    }
    return endpoint;
}

WebSocketConnection::WebSocketConnection(DuplexConnectionOptions options)
    : options_(std::move(options)) {
    auto endpoint = ParseWebSocketUrl(options_.url);
    if (!endpoint) {
        throw TransportError("Hub URL must be an absolute wss:// URL");
    }
    endpoint_ = std::move(*endpoint);
}

WebSocketConnection::~WebSocketConnection() {
    if (worker_.joinable()) {
        try {
            Stop(CancellationToken());
        } catch (const std::exception& ex) {
            std::cerr << "[ControlPlane] Error while stopping connection: " << ex.what() << std::endl;
        }
    }
}

void WebSocketConnection::On(const std::string& target, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[target] = std::move(handler);
}

void WebSocketConnection::OnReconnecting(ReconnectingHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    reconnectingHandler_ = std::move(handler);
}

void WebSocketConnection::OnReconnected(ReconnectedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    reconnectedHandler_ = std::move(handler);
}

void WebSocketConnection::OnClosed(ClosedHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    closedHandler_ = std::move(handler);
}

void WebSocketConnection::Start(const CancellationToken& token) {
    if (worker_.joinable()) {
        if (!workerFinished_) {
            throw TransportError("Connection is already started");
        }
        // Left behind by a Stop() issued from one of our own callbacks.
        worker_.join();
    }

    stopSource_ = CancellationSource();
    if (!tls_) {
        tls_ = BuildTlsContext(options_, endpoint_.host);
    }

    state_ = DuplexConnectionState::Connecting;
    std::shared_ptr<Session> session;
    try {
        session = OpenSession(token);
    } catch (const std::exception&) {
        state_ = DuplexConnectionState::Disconnected;
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = session;
    }
    state_ = DuplexConnectionState::Connected;
    workerFinished_ = false;
    worker_ = std::thread([this, session]() mutable {
        Run(std::move(session));
        workerFinished_ = true;
    });
}

void WebSocketConnection::Stop(const CancellationToken& token) {
    const bool onWorker = worker_.joinable() && std::this_thread::get_id() == worker_.get_id();
    stopSource_.Cancel();

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = current_;
    }

    if (session) {
        Session* raw = session.get();
        net::post(raw->ioc, [this, raw] {
            if (raw->ended) {
                return;
            }
            raw->keepAlive.cancel();
            raw->stream.async_close(websocket::close_code::normal, [this, raw](beast::error_code) {
                EndSession(*raw, "Connection stopped");
            });
        });
    }

    if (onWorker) {
        // Called from a handler: the worker winds down once it returns and is joined later.
        state_ = DuplexConnectionState::Disconnected;
        return;
    }

    const auto deadline = SteadyClock::now() + kStopGracePeriod;
    while (!workerFinished_) {
        if (token.IsCancellationRequested() || SteadyClock::now() >= deadline) {
            if (session) {
                session->ioc.stop();
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    state_ = DuplexConnectionState::Disconnected;
}

void WebSocketConnection::Invoke(const std::string& target, const nlohmann::json& argument, const CancellationToken& token) {
    token.ThrowIfCancelled();

    const std::string invocationId = std::to_string(nextInvocationId_++);
    auto completion = std::make_shared<std::promise<void>>();
    std::future<void> result = completion->get_future();

    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != DuplexConnectionState::Connected || !current_) {
            throw TransportError("Connection is not open");
        }
        session = current_;
        pending_[invocationId] = completion;
    }

    Session* raw = session.get();
    std::string frame = EncodeInvocation(invocationId, target, nlohmann::json::array({argument}));
    net::post(raw->ioc, [this, raw, frame = std::move(frame)]() mutable {
        QueueWrite(*raw, std::move(frame));
    });
    session.reset();

    while (result.wait_for(kPollSlice) != std::future_status::ready) {
        if (token.IsCancellationRequested()) {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(invocationId);
            break;
        }
    }
    token.ThrowIfCancelled();
    result.get();
}

DuplexConnectionState WebSocketConnection::State() const {
    return state_;
}

std::shared_ptr<WebSocketConnection::Session> WebSocketConnection::OpenSession(const CancellationToken& token) {
    auto session = std::make_shared<Session>(*tls_);
    Session& s = *session;

    tcp::resolver::results_type endpoints;
    RunStep(s, token, "Resolve", [&](StepCallback done) {
        s.resolver.async_resolve(
            endpoint_.host,
            endpoint_.port,
            [&endpoints, done](beast::error_code ec, tcp::resolver::results_type results) {
                endpoints = std::move(results);
                done(ec);
            });
    });

    RunStep(s, token, "Connect", [&](StepCallback done) {
        beast::get_lowest_layer(s.stream).async_connect(endpoints, [done](beast::error_code ec, const tcp::endpoint&) {
            done(ec);
        });
    });

    if (!SSL_set_tlsext_host_name(s.stream.next_layer().native_handle(), endpoint_.host.c_str())) {
        throw TransportError("Unable to set TLS server name");
    }

    RunStep(s, token, "TLS handshake", [&](StepCallback done) {
        s.stream.next_layer().async_handshake(ssl::stream_base::client, [done](beast::error_code ec) {
            done(ec);
        });
    });

    beast::get_lowest_layer(s.stream).expires_never();
    s.stream.read_message_max(options_.maxMessageBytes);
    const auto headers = options_.headers;
    s.stream.set_option(websocket::stream_base::decorator([headers](websocket::request_type& request) {
        request.set(http::field::user_agent, kUserAgent);
        for (const auto& header : headers) {
            request.set(header.first, header.second);
        }
    }));

    // Any answer other than 101, redirects included, fails the upgrade.
    websocket::response_type upgradeResponse;
    bool upgradeDeclined = false;
    const std::string hostHeader = endpoint_.port == "443" ? endpoint_.host : endpoint_.host + ":" + endpoint_.port;
    try {
        RunStep(s, token, "WebSocket handshake", [&](StepCallback done) {
            s.stream.async_handshake(
                upgradeResponse,
                hostHeader,
                endpoint_.target,
                [done, &upgradeDeclined](beast::error_code ec) {
                    upgradeDeclined = ec == websocket::error::upgrade_declined;
                    done(ec);
                });
        });
    } catch (const TransportError&) {
        if (upgradeDeclined) {
            throw TransportError("WebSocket handshake rejected with HTTP " + std::to_string(upgradeResponse.result_int()));
        }
        throw;
    }

    s.stream.text(true);
    const std::string handshake = EncodeHandshakeRequest();
    RunStep(s, token, "Hub handshake", [&](StepCallback done) {
        s.stream.async_write(net::buffer(handshake), [done](beast::error_code ec, std::size_t) {
            done(ec);
        });
    });

    std::string response;
    while (response.find(kRecordSeparator) == std::string::npos) {
        RunStep(s, token, "Hub handshake response", [&](StepCallback done) {
            s.stream.async_read(s.readBuffer, [done](beast::error_code ec, std::size_t) {
                done(ec);
            });
        });
        response += beast::buffers_to_string(s.readBuffer.data());
        s.readBuffer.consume(s.readBuffer.size());
    }

    std::optional<std::string> rejection;
    try {
        rejection = ParseHandshakeResponse(response);
    } catch (const std::runtime_error& ex) {
        throw TransportError(ex.what());
    }
    if (rejection) {
        throw TransportError("Hub handshake rejected: " + *rejection);
    }

    s.leftover = response.substr(response.find(kRecordSeparator) + 1);
    s.lastReceived = SteadyClock::now();
    s.lastSent = SteadyClock::now();
    return session;
}

void WebSocketConnection::Run(std::shared_ptr<Session> session) {
    while (session) {
        RunSession(*session);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            current_.reset();
        }
        const std::string error = session->endReason.empty() ? "Connection lost" : session->endReason;
        FailPendingInvocations(error);

        std::optional<std::string> closeError;
        const bool stopping = stopSource_.IsCancellationRequested();
        const bool serverClosed = session->serverClosed;
        if (serverClosed && !session->endReason.empty()) {
            closeError = session->endReason;
        }
        session.reset();

        if (!stopping && !serverClosed) {
            state_ = DuplexConnectionState::Reconnecting;
            ReconnectingHandler onReconnecting;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                onReconnecting = reconnectingHandler_;
            }
            if (onReconnecting) {
                onReconnecting(error);
            }

            session = ReconnectWithBackoff(error);
            if (session) {
                ReconnectedHandler onReconnected;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    current_ = session;
                    onReconnected = reconnectedHandler_;
                }
                state_ = DuplexConnectionState::Connected;
                if (onReconnected) {
                    onReconnected();
                }
                continue;
            }
        }

        state_ = DuplexConnectionState::Disconnected;
        ClosedHandler onClosed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            onClosed = closedHandler_;
        }
        if (onClosed) {
            onClosed(closeError);
        }
    }
}

void WebSocketConnection::RunSession(Session& session) {
    StartRead(session);
    ScheduleKeepAlive(session);
    if (!session.leftover.empty()) {
        std::string leftover = std::move(session.leftover);
        session.leftover.clear();
        net::post(session.ioc, [this, &session, leftover] {
            HandleFrame(session, leftover);
        });
    }

    session.ioc.restart();
    try {
        session.ioc.run();
    } catch (const std::exception& ex) {
        std::cerr << "[ControlPlane] Connection worker error: " << ex.what() << std::endl;
        if (session.endReason.empty()) {
            session.endReason = ex.what();
        }
    }
}

std::shared_ptr<WebSocketConnection::Session> WebSocketConnection::ReconnectWithBackoff(const std::string& error) {
    std::cerr << "[ControlPlane] [WARN] Connection lost, reconnecting: " << error << std::endl;

    const CancellationToken stopToken = stopSource_.Token();
    for (int attempt = 0;; ++attempt) {
        const auto delay = options_.reconnectPolicy.NextDelay(attempt);
        if (stopToken.WaitFor(delay)) {
            return nullptr;
        }

        auto attemptSource = CancellationSource::CreateLinked(stopToken);
        attemptSource.CancelAfter(options_.serverTimeout);
        try {
            return OpenSession(attemptSource.Token());
        } catch (const OperationCancelledError&) {
            if (stopToken.IsCancellationRequested()) {
                return nullptr;
            }
        } catch (const OperationTimedOutError&) {
            std::cerr << "[ControlPlane] [WARN] Reconnect attempt " << (attempt + 1) << " timed out" << std::endl;
        } catch (const std::exception& ex) {
            std::cerr << "[ControlPlane] [WARN] Reconnect attempt " << (attempt + 1) << " failed: " << ex.what() << std::endl;
        }

        if (stopToken.IsCancellationRequested()) {
            return nullptr;
        }
    }
}

void WebSocketConnection::StartRead(Session& session) {
    session.stream.async_read(session.readBuffer, [this, &session](beast::error_code ec, std::size_t) {
        if (session.ended) {
            return;
        }
        if (ec) {
            EndSession(session, ec == websocket::error::closed ? "Server closed the WebSocket" : ec.message());
            return;
        }

        session.lastReceived = SteadyClock::now();
        const std::string frame = beast::buffers_to_string(session.readBuffer.data());
        session.readBuffer.consume(session.readBuffer.size());
        HandleFrame(session, frame);
        if (!session.ended) {
            StartRead(session);
        }
    });
}

void WebSocketConnection::ScheduleKeepAlive(Session& session) {
    const auto tick = std::min<std::chrono::milliseconds>(options_.keepAliveInterval, kMaxKeepAliveTick);
    session.keepAlive.expires_after(tick);
    session.keepAlive.async_wait([this, &session](beast::error_code ec) {
        if (ec || session.ended) {
            return;
        }

        const auto now = SteadyClock::now();
        if (now - session.lastReceived > options_.serverTimeout) {
            EndSession(session, "Server timeout elapsed without receiving a message");
            return;
        }
        if (now - session.lastSent >= options_.keepAliveInterval) {
            QueueWrite(session, EncodePing());
        }
        ScheduleKeepAlive(session);
    });
}

void WebSocketConnection::QueueWrite(Session& session, std::string text) {
    if (session.ended) {
        return;
    }
    session.writeQueue.push_back(std::move(text));
    if (session.writeQueue.size() == 1) {
        WriteNext(session);
    }
}

void WebSocketConnection::WriteNext(Session& session) {
    session.stream.async_write(net::buffer(session.writeQueue.front()), [this, &session](beast::error_code ec, std::size_t) {
        if (session.ended) {
            return;
        }
        if (ec) {
            EndSession(session, ec.message());
            return;
        }

        session.lastSent = SteadyClock::now();
        session.writeQueue.pop_front();
        if (!session.writeQueue.empty()) {
            WriteNext(session);
        }
    });
}

void WebSocketConnection::EndSession(Session& session, const std::string& reason) {
    if (session.ended) {
        return;
    }
    session.ended = true;
    if (session.endReason.empty()) {
        session.endReason = reason;
    }

    beast::error_code ignored;
    session.keepAlive.cancel();
    beast::get_lowest_layer(session.stream).socket().close(ignored);
}

void WebSocketConnection::HandleFrame(Session& session, const std::string& frame) {
    int skipped = 0;
    const auto messages = DecodeMessages(frame, &skipped);
    if (skipped > 0 && DebugLoggingEnabled()) {
        std::cerr << "[ControlPlane] [DEBUG] Skipped " << skipped << " undecodable hub message(s)" << std::endl;
    }

    for (const auto& message : messages) {
        switch (message.type) {
        case HubMessageType::Invocation: {
            MessageHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                const auto it = handlers_.find(message.target);
                if (it != handlers_.end()) {
                    handler = it->second;
                }
            }
            if (!handler) {
                if (DebugLoggingEnabled()) {
                    std::cerr << "[ControlPlane] [DEBUG] No handler for hub target " << message.target << std::endl;
                }
                break;
            }
            try {
                handler(message.arguments);
            } catch (const std::exception& ex) {
                std::cerr << "[ControlPlane] Handler for " << message.target << " failed: " << ex.what() << std::endl;
            }
            break;
        }
        case HubMessageType::Completion:
            CompleteInvocation(message.invocationId, message.error);
            break;
        case HubMessageType::Close:
            session.serverClosed = !message.allowReconnect;
            EndSession(session, message.error.value_or("Server closed the connection"));
            return;
        case HubMessageType::Ping:
        default:
            break;
        }
    }
}

void WebSocketConnection::CompleteInvocation(const std::string& invocationId, const std::optional<std::string>& error) {
    std::shared_ptr<std::promise<void>> completion;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = pending_.find(invocationId);
        if (it == pending_.end()) {
            return;
        }
        completion = it->second;
        pending_.erase(it);
    }

    if (error) {
        completion->set_exception(std::make_exception_ptr(TransportError("Server returned an error: " + *error)));
    } else {
        completion->set_value();
    }
}

void WebSocketConnection::FailPendingInvocations(const std::string& error) {
    std::map<std::string, std::shared_ptr<std::promise<void>>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
    }
    for (auto& entry : pending) {
        entry.second->set_exception(std::make_exception_ptr(TransportError(error)));
    }
}
