#include "AgentMetrics.hpp"

#if FLEETLINK_ENABLE_OTEL
#include <opentelemetry/metrics/provider.h>
#endif

namespace {
const char* Direction(bool isUpload) {
    return isUpload ? "upload" : "download";
}

int64_t Lookup(const std::map<std::string, int64_t>& counters, const std::string& key) {
    const auto it = counters.find(key);
    return it == counters.end() ? 0 : it->second;
}
} // namespace

AgentMetrics::AgentMetrics() {
#if FLEETLINK_ENABLE_OTEL
    meter_ = opentelemetry::metrics::Provider::GetMeterProvider()->GetMeter(kMeterName, "1.0.0");
    heartbeatsCounter_ = meter_->CreateUInt64Counter(
        "agent.heartbeats.sent", "Number of heartbeats sent to control plane");
    reconnectCounter_ = meter_->CreateUInt64Counter(
        "agent.connection.reconnect_attempts", "Number of reconnection attempts");
    commandsCounter_ = meter_->CreateUInt64Counter(
        "agent.commands.received", "Number of commands received from control plane");
    filesCounter_ = meter_->CreateUInt64Counter(
        "agent.files.transferred", "Number of files transferred");
    bytesCounter_ = meter_->CreateUInt64Counter(
        "agent.files.bytes_transferred", "Total bytes transferred", "bytes");
#endif
}

void AgentMetrics::RecordHeartbeatSent() {
    heartbeatsSent_.fetch_add(1);
#if FLEETLINK_ENABLE_OTEL
    heartbeatsCounter_->Add(1);
#endif
}

void AgentMetrics::RecordReconnectAttempt() {
    reconnectAttempts_.fetch_add(1);
#if FLEETLINK_ENABLE_OTEL
    reconnectCounter_->Add(1);
#endif
}

void AgentMetrics::RecordCommandReceived(const std::string& commandType) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++commandsReceived_[commandType];
    }
#if FLEETLINK_ENABLE_OTEL
    commandsCounter_->Add(1, {{"command_type", opentelemetry::nostd::string_view(commandType)}});
#endif
}

void AgentMetrics::RecordFileTransfer(uint64_t bytes, bool isUpload) {
    const std::string direction = Direction(isUpload);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++filesTransferred_[direction];
        bytesTransferred_[direction] += static_cast<int64_t>(bytes);
    }
#if FLEETLINK_ENABLE_OTEL
    filesCounter_->Add(1, {{"direction", opentelemetry::nostd::string_view(direction)}});
    bytesCounter_->Add(bytes, {{"direction", opentelemetry::nostd::string_view(direction)}});
#endif
}

int64_t AgentMetrics::HeartbeatsSent() const {
    return heartbeatsSent_.load();
}

int64_t AgentMetrics::ReconnectAttempts() const {
    return reconnectAttempts_.load();
}

int64_t AgentMetrics::CommandsReceived(const std::string& commandType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Lookup(commandsReceived_, commandType);
}

std::map<std::string, int64_t> AgentMetrics::CommandsReceivedByType() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commandsReceived_;
}

int64_t AgentMetrics::FilesTransferred(const std::string& direction) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Lookup(filesTransferred_, direction);
}

int64_t AgentMetrics::BytesTransferred(const std::string& direction) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Lookup(bytesTransferred_, direction);
}
