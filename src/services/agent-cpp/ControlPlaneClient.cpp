#include "ControlPlaneClient.hpp"

#include "Tracing.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <utility>
#include <vector>

namespace {
constexpr auto kLockPollInterval = std::chrono::milliseconds(50);

// Non-zero while this thread is inside a transport callback.
thread_local int transportCallbackDepth = 0;

struct TransportCallbackScope {
    TransportCallbackScope() { ++transportCallbackDepth; }
    ~TransportCallbackScope() { --transportCallbackDepth; }
};

bool StartsWithIgnoreCase(const std::string& value, const std::string& prefix) {
    if (value.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), value.begin(), [](char left, char right) {
        return std::tolower(static_cast<unsigned char>(left)) == std::tolower(static_cast<unsigned char>(right));
    });
}

// The hub delivers a command either as a JSON string or as an inline object.
std::string ExtractRawCommand(const nlohmann::json& arguments) {
    if (!arguments.is_array() || arguments.empty()) {
        return {};
    }
    const auto& first = arguments.front();
    if (first.is_string()) {
        return first.get<std::string>();
    }
    return first.dump();
}
} // namespace

ControlPlaneClient::ControlPlaneClient(
    AgentOptions options,
    CertificateStore& certificates,
    DuplexConnectionFactory connectionFactory,
    AgentMetrics& metrics)
    : options_(std::move(options)),
      certificates_(certificates),
      connectionFactory_(std::move(connectionFactory)),
      metrics_(metrics),
      validator_(options_.nodeId, options_.organizationId) {
    stateMachine_.Subscribe([](const ConnectionStateChangedEvent& event) {
        ScopedSpan span("agent.connection.state");
        span.SetAttribute("connection.previous", ToString(event.previous));
        span.SetAttribute("connection.current", ToString(event.current));
        if (event.error) {
            std::cerr << "[ControlPlane] State " << ToString(event.previous) << " -> " << ToString(event.current)
                      << ": " << *event.error << std::endl;
        } else {
            std::cout << "[ControlPlane] State " << ToString(event.previous) << " -> " << ToString(event.current)
                      << std::endl;
        }
        span.MarkSucceeded();
    });
}

ControlPlaneClient::~ControlPlaneClient() {
    try {
        Disconnect(CancellationToken());
    } catch (const std::exception& ex) {
        std::cerr << "[ControlPlane] Error during shutdown: " << ex.what() << std::endl;
    }
}

void ControlPlaneClient::Connect(const CancellationToken& token) {
    AcquireConnectLock(token);
    std::unique_lock<std::timed_mutex> lock(connectMutex_, std::adopt_lock);

    const ConnectionState current = stateMachine_.Current();
    if (current == ConnectionState::Connected || current == ConnectionState::Connecting) {
        return;
    }

    ScopedSpan span("agent.connect");
    stateMachine_.Apply(ConnectionTrigger::Connect);

    try {
        if (!StartsWithIgnoreCase(options_.controlPlane.endpoint, "https://")) {
            throw ConfigurationError("Control plane endpoint must use https");
        }

        const std::string hubUrl = BuildHubUrl();
        span.SetAttribute("server.address", hubUrl);
        std::cout << "[ControlPlane] Connecting to control plane at " << hubUrl << std::endl;

        // The previous transport and certificate are gone before a new certificate is loaded.
        ReleaseConnection(token);

        std::unique_ptr<ClientCertificate> certificate = certificates_.GetClientCertificate();
        if (!certificate && options_.nodeId) {
            throw ConfigurationError("A client certificate is required once the node is enrolled");
        }
        if (certificate && certificate->NeedsRenewal(options_.security.certificateRenewalThresholdDays)) {
            std::cerr << "[ControlPlane] [WARN] Client certificate is within its renewal window" << std::endl;
        }

        DuplexConnectionOptions connectionOptions;
        connectionOptions.url = hubUrl;
        if (options_.nodeId) {
            connectionOptions.headers["X-Node-Id"] = options_.nodeId->ToString();
        }
        connectionOptions.clientCertificate = certificate.get();
        connectionOptions.caCertificatePath = options_.security.caCertificatePath;
        connectionOptions.verifyHost = options_.security.verifyHost;
        connectionOptions.keepAliveInterval = options_.controlPlane.keepAliveInterval;
        connectionOptions.serverTimeout = options_.controlPlane.serverTimeout;
        connectionOptions.reconnectPolicy = ReconnectPolicy(
            options_.controlPlane.reconnectBaseDelay,
            options_.controlPlane.maxReconnectDelay);

        std::shared_ptr<DuplexConnection> connection = connectionFactory_(connectionOptions);
        if (!connection) {
            throw TransportError("Connection factory returned no connection");
        }

        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> guard(connectionMutex_);
            generation = ++generation_;
            connection_ = connection;
            certificate_ = std::move(certificate);
        }

        auto isCurrent = [this, generation] {
            std::lock_guard<std::mutex> guard(connectionMutex_);
            return generation == generation_;
        };

        connection->On(kReceiveCommandTarget, [this, isCurrent](const nlohmann::json& arguments) {
            TransportCallbackScope scope;
            if (isCurrent()) {
                HandleCommandMessage(ExtractRawCommand(arguments));
            }
        });
        connection->On(kReceivePingTarget, [](const nlohmann::json&) {
            if (DebugLoggingEnabled()) {
                std::cout << "[ControlPlane] [DEBUG] Received ping from control plane" << std::endl;
            }
        });
        connection->OnReconnecting([this, isCurrent](const std::string& error) {
            TransportCallbackScope scope;
            if (!isCurrent()) {
                return;
            }
            metrics_.RecordReconnectAttempt();
            std::cerr << "[ControlPlane] [WARN] Reconnecting to control plane: " << error << std::endl;
            stateMachine_.Apply(ConnectionTrigger::TransportReconnecting, error);
        });
        connection->OnReconnected([this, isCurrent] {
            TransportCallbackScope scope;
            if (!isCurrent()) {
                return;
            }
            std::cout << "[ControlPlane] Reconnected to control plane" << std::endl;
            stateMachine_.Apply(ConnectionTrigger::TransportReconnected);
        });
        connection->OnClosed([this, isCurrent](const std::optional<std::string>& error) {
            TransportCallbackScope scope;
            if (!isCurrent()) {
                return;
            }
            if (error) {
                std::cerr << "[ControlPlane] [WARN] Connection to control plane closed with error: " << *error << std::endl;
            } else {
                std::cout << "[ControlPlane] Connection to control plane closed" << std::endl;
            }
            stateMachine_.Apply(ConnectionTrigger::TransportClosed, error);
        });

        CancellationSource timeout = CancellationSource::CreateLinked(token);
        timeout.CancelAfter(options_.controlPlane.connectionTimeout);
        connection->Start(timeout.Token());

        stateMachine_.Apply(ConnectionTrigger::ConnectSucceeded);
        span.MarkSucceeded();
        std::cout << "[ControlPlane] Connected to control plane" << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[ControlPlane] Failed to connect to control plane: " << ex.what() << std::endl;
        span.MarkFailed(ex.what());
        ReleaseConnection(CancellationToken());
        stateMachine_.Apply(ConnectionTrigger::FatalError, std::string(ex.what()));
        throw;
    }
}

void ControlPlaneClient::Disconnect(const CancellationToken& token) {
    AcquireConnectLock(token);
    std::unique_lock<std::timed_mutex> lock(connectMutex_, std::adopt_lock);

    if (stateMachine_.Current() == ConnectionState::Disconnected) {
        return;
    }

    ScopedSpan span("agent.disconnect");
    std::cout << "[ControlPlane] Disconnecting from control plane" << std::endl;

    ReleaseConnection(token);

    stateMachine_.Apply(ConnectionTrigger::Disconnect);
    span.MarkSucceeded();
}

ConnectionState ControlPlaneClient::State() const {
    return stateMachine_.Current();
}

bool ControlPlaneClient::IsConnected() const {
    return stateMachine_.Current() == ConnectionState::Connected;
}

void ControlPlaneClient::SendHeartbeat(const HeartbeatPayload& payload, const CancellationToken& token) {
    if (!IsConnected()) {
        std::cerr << "[ControlPlane] [WARN] Cannot send heartbeat: not connected" << std::endl;
        return;
    }

    ScopedSpan span("agent.heartbeat");
    try {
        InvokeWithTimeout(kHeartbeatMethod, payload, token);
    } catch (const std::exception& ex) {
        std::cerr << "[ControlPlane] Failed to send heartbeat: " << ex.what() << std::endl;
        span.MarkFailed(ex.what());
        throw;
    }

    metrics_.RecordHeartbeatSent();
    span.MarkSucceeded();
    if (DebugLoggingEnabled()) {
        std::cout << "[ControlPlane] [DEBUG] Heartbeat sent for node " << payload.nodeId.ToString() << std::endl;
    }
}

bool ControlPlaneClient::SendCommandResult(const CommandResult& result, const CancellationToken& token) {
    if (!IsConnected()) {
        std::cerr << "[ControlPlane] [WARN] Cannot send command result: not connected" << std::endl;
        return false;
    }

    ScopedSpan span("agent.command_result");
    span.SetAttribute("command.id", result.commandId.ToString());
    span.SetAttribute("command.status", ToString(result.status));
    try {
        InvokeWithTimeout(kCommandResultMethod, result, token);
    } catch (const std::exception& ex) {
        std::cerr << "[ControlPlane] Failed to send command result for " << result.commandId.ToString() << ": "
                  << ex.what() << std::endl;
        span.MarkFailed(ex.what());
        return false;
    }

    span.MarkSucceeded();
    if (DebugLoggingEnabled()) {
        std::cout << "[ControlPlane] [DEBUG] Command result sent for command " << result.commandId.ToString() << std::endl;
    }
    return true;
}

void ControlPlaneClient::SendTelemetry(const TelemetryPayload& payload, const CancellationToken& token) noexcept {
    if (!IsConnected()) {
        return;
    }

    try {
        ScopedSpan span("agent.telemetry");
        InvokeWithTimeout(kTelemetryMethod, payload, token);
        span.MarkSucceeded();
    } catch (const std::exception& ex) {
        if (DebugLoggingEnabled()) {
            std::cerr << "[ControlPlane] [DEBUG] Failed to send telemetry: " << ex.what() << std::endl;
        }
    }
}

ControlPlaneClient::SubscriptionId ControlPlaneClient::SubscribeStateChanged(StateChangedHandler handler) {
    return stateMachine_.Subscribe(std::move(handler));
}

void ControlPlaneClient::UnsubscribeStateChanged(SubscriptionId id) {
    stateMachine_.Unsubscribe(id);
}

ControlPlaneClient::SubscriptionId ControlPlaneClient::SubscribeCommandReceived(CommandHandler handler) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    const SubscriptionId id = nextCommandHandlerId_++;
    commandHandlers_[id] = std::move(handler);
    return id;
}

void ControlPlaneClient::UnsubscribeCommandReceived(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    commandHandlers_.erase(id);
}

void ControlPlaneClient::HandleCommandMessage(const std::string& rawMessage) {
    const CommandValidationOutcome outcome = validator_.Validate(rawMessage);
    if (!outcome.Accepted()) {
        std::cerr << "[ControlPlane] [WARN] Dropped inbound command: " << ToString(outcome.rejection) << std::endl;
        return;
    }

    const CommandEnvelope& command = *outcome.envelope;
    const std::string commandType = SanitizeCommandType(command.commandType);
    metrics_.RecordCommandReceived(commandType);
    std::cout << "[ControlPlane] Received command " << commandType << " with ID " << command.commandId.ToString()
              << std::endl;

    CommandReceivedEvent event;
    event.command = command;
    event.receivedAt = std::chrono::system_clock::now();

    std::vector<CommandHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(subscribersMutex_);
        for (const auto& entry : commandHandlers_) {
            handlers.push_back(entry.second);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& ex) {
            std::cerr << "[ControlPlane] Command handler failed for " << command.commandId.ToString() << ": "
                      << ex.what() << std::endl;
        }
    }
}

std::string ControlPlaneClient::BuildHubUrl() const {
    std::string base = options_.controlPlane.endpoint.substr(std::string("https://").size());
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    std::string path = options_.controlPlane.hubPath;
    if (path.empty() || path.front() != '/') {
        path.insert(path.begin(), '/');
    }
    return "wss://" + base + path;
}

void ControlPlaneClient::ReleaseConnection(const CancellationToken& token) {
    std::shared_ptr<DuplexConnection> connection;
    std::unique_ptr<ClientCertificate> certificate;
    {
        std::lock_guard<std::mutex> guard(connectionMutex_);
        ++generation_;
        connection = std::move(connection_);
        certificate = std::move(certificate_);
    }

    if (connection) {
        connection->Stop(token);
    }

    std::shared_ptr<DuplexConnection> retired;
    {
        std::lock_guard<std::mutex> guard(connectionMutex_);
        if (transportCallbackDepth > 0 && connection) {
            // A transport must not be destroyed on its own callback thread; keep it until the
            // next release from outside.
            retiredConnection_ = std::move(connection);
        } else if (transportCallbackDepth == 0) {
            retired = std::move(retiredConnection_);
        }
    }
    connection.reset();
    retired.reset();
    certificate.reset();
}

std::shared_ptr<DuplexConnection> ControlPlaneClient::CurrentConnection() const {
    std::lock_guard<std::mutex> guard(connectionMutex_);
    return connection_;
}

void ControlPlaneClient::InvokeWithTimeout(const char* method, const nlohmann::json& payload, const CancellationToken& token) {
    std::shared_ptr<DuplexConnection> connection = CurrentConnection();
    if (!connection) {
        throw TransportError("Connection is not open");
    }

    CancellationSource timeout = CancellationSource::CreateLinked(token);
    timeout.CancelAfter(options_.controlPlane.callTimeout);
    // The hub methods take the payload as a serialized JSON string.
    connection->Invoke(method, nlohmann::json(payload.dump()), timeout.Token());
}

void ControlPlaneClient::AcquireConnectLock(const CancellationToken& token) {
    while (!connectMutex_.try_lock_for(kLockPollInterval)) {
        token.ThrowIfCancelled();
    }
}
