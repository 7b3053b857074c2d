#include "AgentMetrics.hpp"
#include "AgentOptions.hpp"
#include "CancellationToken.hpp"
#include "CertificateStore.hpp"
#include "CommandDispatcher.hpp"
#include "ControlPlaneClient.hpp"
#include "CprFileHttpClient.hpp"
#include "FileTransferService.hpp"
#include "ReconnectPolicy.hpp"
#include "SysMonitor.hpp"
#include "Tracing.hpp"
#include "WebSocketConnection.hpp"

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {
constexpr auto kShutdownTimeout = std::chrono::seconds(5);

// SIGINT and SIGTERM are blocked in every thread and consumed here, so the stop request can
// go through the ordinary cancellation machinery.
class SignalWatcher {
public:
    explicit SignalWatcher(CancellationSource& stop) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        thread_ = std::thread([this, &stop] {
            int received = 0;
            if (sigwait(&signals_, &received) == 0 && !released_) {
                std::cout << "[Agent] Signal " << received << " received, shutting down." << std::endl;
            }
            stop.Cancel();
        });
    }

    ~SignalWatcher() {
        released_ = true;
        pthread_kill(thread_.native_handle(), SIGTERM);
        thread_.join();
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    sigset_t signals_;
    std::atomic<bool> released_{false};
    std::thread thread_;
};

bool LoadOptions(AgentOptions& options) {
    std::vector<std::string> problems;
    options = LoadAgentOptionsFromEnvironment(&problems);
    for (auto& problem : ValidateAgentOptions(options)) {
        problems.push_back(std::move(problem));
    }

    for (const auto& problem : problems) {
        std::cerr << "[Agent] Invalid configuration: " << problem << std::endl;
    }
    return problems.empty();
}

HeartbeatPayload BuildHeartbeat(const AgentOptions& options, SysMonitor& monitor, const FileTransferService& transfers) {
    HeartbeatPayload heartbeat;
    heartbeat.nodeId = options.nodeId.value_or(Uuid());
    heartbeat.agentVersion = options.agentVersion;
    heartbeat.status = NodeStatus::Online;
    heartbeat.metrics = monitor.Collect();
    if (heartbeat.metrics->MemoryUsagePercent() > 95.0) {
        heartbeat.status = NodeStatus::Degraded;
        heartbeat.warnings.push_back("Memory usage above 95%");
    }
    const std::size_t active = transfers.GetActiveTransfers().size();
    if (active >= options.files.maxConcurrentTransfers) {
        heartbeat.warnings.push_back("File transfer capacity exhausted");
    }
    return heartbeat;
}

TelemetryPayload BuildTelemetry(const AgentOptions& options, const AgentMetrics& metrics, const FileTransferService& transfers) {
    TelemetryPayload telemetry;
    telemetry.nodeId = options.nodeId.value_or(Uuid());
    telemetry.metrics["transfers.active"] = static_cast<double>(transfers.GetActiveTransfers().size());
    telemetry.metrics["heartbeats.sent"] = static_cast<double>(metrics.HeartbeatsSent());
    telemetry.metrics["connection.reconnect_attempts"] = static_cast<double>(metrics.ReconnectAttempts());
    telemetry.metrics["files.bytes_transferred.download"] = static_cast<double>(metrics.BytesTransferred("download"));
    telemetry.metrics["files.bytes_transferred.upload"] = static_cast<double>(metrics.BytesTransferred("upload"));
    return telemetry;
}
} // namespace

int main() {
    std::cout << "FleetLink Agent Starting..." << std::endl;

    AgentOptions options;
    if (!LoadOptions(options)) {
        return 1;
    }

    CancellationSource stop;
    SignalWatcher signals(stop);
    const CancellationToken stopToken = stop.Token();

    TraceConfig traceConfig;
    traceConfig.enabled = options.tracing.enabled;
    traceConfig.endpoint = options.tracing.endpoint;
    traceConfig.serviceName = options.tracing.serviceName;
    traceConfig.serviceVersion = options.agentVersion;
    Tracer::Instance().Configure(traceConfig);

    std::error_code ec;
    std::filesystem::create_directories(options.files.tempDirectory, ec);
    if (ec) {
        std::cerr << "[Agent] [WARN] Temp directory could not be created: " << ec.message() << std::endl;
    }

    AgentMetrics metrics;
    FileCertificateStore certificates(options.security.certificatePath, options.security.privateKeyPath);
    DuplexConnectionFactory connectionFactory =
        [](const DuplexConnectionOptions& connectionOptions) -> std::unique_ptr<DuplexConnection> {
        return std::make_unique<WebSocketConnection>(connectionOptions);
    };
    ControlPlaneClient client(options, certificates, connectionFactory, metrics);

    CprFileHttpClientOptions httpOptions;
    httpOptions.baseAddress = options.controlPlane.endpoint;
    httpOptions.caCertificatePath = options.security.caCertificatePath;
    httpOptions.certificatePath = options.security.certificatePath;
    httpOptions.privateKeyPath = options.security.privateKeyPath;
    httpOptions.verifyHost = options.security.verifyHost;
    FileHttpClientFactory httpClientFactory = [httpOptions](const std::string& profile) -> std::unique_ptr<FileHttpClient> {
        if (profile != CprFileHttpClient::kProfileName) {
            return nullptr;
        }
        return std::make_unique<CprFileHttpClient>(httpOptions);
    };
    FileTransferService transfers(options.files, options.process, httpClientFactory, metrics);

    CommandDispatcher dispatcher(
        transfers,
        [&client](const CommandResult& result) { return client.SendCommandResult(result); },
        options.nodeId);
    client.SubscribeCommandReceived([&dispatcher](const CommandReceivedEvent& event) {
        dispatcher.Dispatch(event.command);
    });

    SysMonitor monitor(options.process.serverBasePath);
    ReconnectPolicy connectBackoff(options.controlPlane.reconnectBaseDelay, options.controlPlane.maxReconnectDelay);
    int failedConnects = 0;
    int exitCode = 0;

    while (!stopToken.IsCancellationRequested()) {
        const ConnectionState state = client.State();
        if (state == ConnectionState::Disconnected || state == ConnectionState::Failed) {
            try {
                client.Connect(stopToken);
                failedConnects = 0;
                std::cout << "[Agent] Connected to control plane." << std::endl;
            } catch (const ConfigurationError& ex) {
                std::cerr << "[Agent] Configuration error: " << ex.what() << std::endl;
                exitCode = 1;
                break;
            } catch (const OperationCancelledError&) {
                break;
            } catch (const std::exception& ex) {
                const auto delay = connectBackoff.NextDelay(failedConnects++);
                std::cerr << "[Agent] Connect failed: " << ex.what() << ". Retrying in " << delay.count() << "ms" << std::endl;
                stopToken.WaitFor(delay);
                continue;
            }
        }

        if (client.IsConnected()) {
            try {
                client.SendHeartbeat(BuildHeartbeat(options, monitor, transfers), stopToken);
                std::cout << "[Agent] Heartbeat sent." << std::endl;
            } catch (const OperationCancelledError&) {
                break;
            } catch (const std::exception& ex) {
                std::cerr << "[Agent] Failed to send heartbeat: " << ex.what() << std::endl;
            }
            client.SendTelemetry(BuildTelemetry(options, metrics, transfers), stopToken);
        }

        stopToken.WaitFor(std::chrono::duration_cast<std::chrono::milliseconds>(options.heartbeatInterval));
    }

    dispatcher.Shutdown();
    try {
        CancellationSource shutdownDeadline;
        shutdownDeadline.CancelAfter(kShutdownTimeout);
        client.Disconnect(shutdownDeadline.Token());
    } catch (const std::exception& ex) {
        std::cerr << "[Agent] Disconnect failed: " << ex.what() << std::endl;
    }
    Tracer::Instance().Shutdown();

    std::cout << "[Agent] Stopped." << std::endl;
    return exitCode;
}
