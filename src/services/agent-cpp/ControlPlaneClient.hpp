#pragma once

#include "AgentMetrics.hpp"
#include "AgentOptions.hpp"
#include "CancellationToken.hpp"
#include "CertificateStore.hpp"
#include "CommandEnvelope.hpp"
#include "CommandValidator.hpp"
#include "ConnectionState.hpp"
#include "ControlPlaneMessages.hpp"
#include "DuplexConnection.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

class ControlPlaneClient {
public:
    using CommandHandler = std::function<void(const CommandReceivedEvent&)>;
    using StateChangedHandler = ConnectionStateMachine::Handler;
    using SubscriptionId = uint64_t;

    static constexpr const char* kReceiveCommandTarget = "ReceiveCommand";
    static constexpr const char* kReceivePingTarget = "ReceivePing";
    static constexpr const char* kHeartbeatMethod = "Heartbeat";
    static constexpr const char* kCommandResultMethod = "CommandResult";
    static constexpr const char* kTelemetryMethod = "Telemetry";

    ControlPlaneClient(
        AgentOptions options,
        CertificateStore& certificates,
        DuplexConnectionFactory connectionFactory,
        AgentMetrics& metrics);
    ~ControlPlaneClient();

    ControlPlaneClient(const ControlPlaneClient&) = delete;
    ControlPlaneClient& operator=(const ControlPlaneClient&) = delete;

    // Idempotent while connecting or connected. Throws ConfigurationError for problems that a
    // retry cannot fix, and rethrows transport, cancellation and timeout errors after moving the
    // client to Failed.
    void Connect(const CancellationToken& token = CancellationToken());
    void Disconnect(const CancellationToken& token = CancellationToken());

    ConnectionState State() const;
    bool IsConnected() const;

    // Skipped when not connected; rethrows delivery failures.
    void SendHeartbeat(const HeartbeatPayload& payload, const CancellationToken& token = CancellationToken());
    // Returns false when not connected or when delivery failed.
    bool SendCommandResult(const CommandResult& result, const CancellationToken& token = CancellationToken());
    // Best effort: never throws and never retries.
    void SendTelemetry(const TelemetryPayload& payload, const CancellationToken& token = CancellationToken()) noexcept;

    SubscriptionId SubscribeStateChanged(StateChangedHandler handler);
    void UnsubscribeStateChanged(SubscriptionId id);
    SubscriptionId SubscribeCommandReceived(CommandHandler handler);
    void UnsubscribeCommandReceived(SubscriptionId id);

    // Entry point for a raw "ReceiveCommand" payload. Rejected commands are logged and dropped.
    void HandleCommandMessage(const std::string& rawMessage);

private:
    std::string BuildHubUrl() const;
    // Stops and drops the transport, then the certificate it was built with.
    void ReleaseConnection(const CancellationToken& token);
    std::shared_ptr<DuplexConnection> CurrentConnection() const;
    void InvokeWithTimeout(const char* method, const nlohmann::json& payload, const CancellationToken& token);
    void AcquireConnectLock(const CancellationToken& token);

    AgentOptions options_;
    CertificateStore& certificates_;
    DuplexConnectionFactory connectionFactory_;
    AgentMetrics& metrics_;
    CommandValidator validator_;
    ConnectionStateMachine stateMachine_;

    // Serializes Connect and Disconnect only; sends never take it.
    std::timed_mutex connectMutex_;

    mutable std::mutex connectionMutex_;
    std::shared_ptr<DuplexConnection> connection_;
    std::unique_ptr<ClientCertificate> certificate_;
    // Released from inside one of its own callbacks; destroyed by a later release.
    std::shared_ptr<DuplexConnection> retiredConnection_;
    uint64_t generation_ = 0;

    mutable std::mutex subscribersMutex_;
    std::map<SubscriptionId, CommandHandler> commandHandlers_;
    SubscriptionId nextCommandHandlerId_ = 1;
};
