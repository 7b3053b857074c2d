#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#if FLEETLINK_ENABLE_OTEL
#include <opentelemetry/metrics/meter.h>
#include <opentelemetry/metrics/sync_instruments.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/nostd/unique_ptr.h>
#endif

// Agent counters. Values are always kept in-process; with FLEETLINK_ENABLE_OTEL they are
// also exported through the globally registered OpenTelemetry meter provider.
class AgentMetrics {
public:
    static constexpr const char* kMeterName = "fleetlink.agent";

    AgentMetrics();

    AgentMetrics(const AgentMetrics&) = delete;
    AgentMetrics& operator=(const AgentMetrics&) = delete;

    void RecordHeartbeatSent();
    void RecordReconnectAttempt();
    // Callers pass a type that already went through SanitizeCommandType.
    void RecordCommandReceived(const std::string& commandType);
    void RecordFileTransfer(uint64_t bytes, bool isUpload);

    int64_t HeartbeatsSent() const;
    int64_t ReconnectAttempts() const;
    int64_t CommandsReceived(const std::string& commandType) const;
    std::map<std::string, int64_t> CommandsReceivedByType() const;
    int64_t FilesTransferred(const std::string& direction) const;
    int64_t BytesTransferred(const std::string& direction) const;

private:
    std::atomic<int64_t> heartbeatsSent_{0};
    std::atomic<int64_t> reconnectAttempts_{0};

    mutable std::mutex mutex_;
    std::map<std::string, int64_t> commandsReceived_;
    std::map<std::string, int64_t> filesTransferred_;
    std::map<std::string, int64_t> bytesTransferred_;

#if FLEETLINK_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::metrics::Meter> meter_;
    opentelemetry::nostd::unique_ptr<opentelemetry::metrics::Counter<uint64_t>> heartbeatsCounter_;
    opentelemetry::nostd::unique_ptr<opentelemetry::metrics::Counter<uint64_t>> reconnectCounter_;
    opentelemetry::nostd::unique_ptr<opentelemetry::metrics::Counter<uint64_t>> commandsCounter_;
    opentelemetry::nostd::unique_ptr<opentelemetry::metrics::Counter<uint64_t>> filesCounter_;
    opentelemetry::nostd::unique_ptr<opentelemetry::metrics::Counter<uint64_t>> bytesCounter_;
#endif
};
