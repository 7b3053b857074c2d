#pragma once

#include "CancellationToken.hpp"
#include "ReconnectPolicy.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

class ClientCertificate;

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class DuplexConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

struct DuplexConnectionOptions {
    std::string url;
    std::map<std::string, std::string> headers;
    // Borrowed for the duration of Start(); the TLS context keeps its own references.
    const ClientCertificate* clientCertificate = nullptr;
    std::string caCertificatePath;
    bool verifyHost = true;
    std::chrono::milliseconds keepAliveInterval{15000};
    std::chrono::milliseconds serverTimeout{30000};
    ReconnectPolicy reconnectPolicy{std::chrono::seconds(1), std::chrono::seconds(30)};
    std::size_t maxMessageBytes = 2 * 1024 * 1024;
};

// A persistent connection that carries caller-invoked calls and server-pushed messages.
// Callbacks run on the connection's own threads. They may call Stop(), which then returns without
// waiting for the thread, but must not call Start() or destroy the connection.
class DuplexConnection {
public:
    using MessageHandler = std::function<void(const nlohmann::json& arguments)>;
    using ReconnectingHandler = std::function<void(const std::string& error)>;
    using ReconnectedHandler = std::function<void()>;
    using ClosedHandler = std::function<void(const std::optional<std::string>& error)>;

    virtual ~DuplexConnection() = default;

    // Handlers must be registered before Start().
    virtual void On(const std::string& target, MessageHandler handler) = 0;
    virtual void OnReconnecting(ReconnectingHandler handler) = 0;
    virtual void OnReconnected(ReconnectedHandler handler) = 0;
    virtual void OnClosed(ClosedHandler handler) = 0;

    // Throws TransportError on handshake failure and OperationCancelledError /
    // OperationTimedOutError when the token fires first.
    virtual void Start(const CancellationToken& token) = 0;
    virtual void Stop(const CancellationToken& token) = 0;

    // Waits for the server's completion. Throws TransportError when the connection is not open,
    // is lost while waiting, or the server reports an error.
    virtual void Invoke(const std::string& target, const nlohmann::json& argument, const CancellationToken& token) = 0;

    virtual DuplexConnectionState State() const = 0;
};

using DuplexConnectionFactory = std::function<std::unique_ptr<DuplexConnection>(const DuplexConnectionOptions& options)>;
