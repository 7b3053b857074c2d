#pragma once

#include "CancellationToken.hpp"
#include "DuplexConnection.hpp"

#include <boost/asio/ssl/context.hpp>

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct WebSocketEndpoint {
    std::string host;
    std::string port;
    std::string target;
};

// Accepts wss:// URLs only. The port defaults to 443 and the target to "/".
std::optional<WebSocketEndpoint> ParseWebSocketUrl(const std::string& url);

// Hub connection over a TLS WebSocket. Start() performs the TLS, WebSocket and hub handshakes on
// the calling thread; afterwards a worker thread owns the socket, answers keep-alive duties and
// re-establishes the session with backoff when it is lost.
class WebSocketConnection : public DuplexConnection {
public:
    explicit WebSocketConnection(DuplexConnectionOptions options);
    ~WebSocketConnection() override;

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    void On(const std::string& target, MessageHandler handler) override;
    void OnReconnecting(ReconnectingHandler handler) override;
    void OnReconnected(ReconnectedHandler handler) override;
    void OnClosed(ClosedHandler handler) override;

    void Start(const CancellationToken& token) override;
    void Stop(const CancellationToken& token) override;
    void Invoke(const std::string& target, const nlohmann::json& argument, const CancellationToken& token) override;

    DuplexConnectionState State() const override;

private:
    struct Session;

    std::shared_ptr<Session> OpenSession(const CancellationToken& token);
    void Run(std::shared_ptr<Session> session);
    void RunSession(Session& session);
    std::shared_ptr<Session> ReconnectWithBackoff(const std::string& error);

    void StartRead(Session& session);
    void ScheduleKeepAlive(Session& session);
    void QueueWrite(Session& session, std::string text);
    void WriteNext(Session& session);
    void EndSession(Session& session, const std::string& reason);

    void HandleFrame(Session& session, const std::string& frame);
    void CompleteInvocation(const std::string& invocationId, const std::optional<std::string>& error);
    void FailPendingInvocations(const std::string& error);

    DuplexConnectionOptions options_;
    WebSocketEndpoint endpoint_;
    std::unique_ptr<boost::asio::ssl::context> tls_;

    std::map<std::string, MessageHandler> handlers_;
    ReconnectingHandler reconnectingHandler_;
    ReconnectedHandler reconnectedHandler_;
    ClosedHandler closedHandler_;

    std::atomic<DuplexConnectionState> state_{DuplexConnectionState::Disconnected};
    CancellationSource stopSource_;
    std::thread worker_;
    std::atomic<bool> workerFinished_{true};

    mutable std::mutex mutex_;
    std::shared_ptr<Session> current_;
    std::map<std::string, std::shared_ptr<std::promise<void>>> pending_;
    std::atomic<uint64_t> nextInvocationId_{1};
};
