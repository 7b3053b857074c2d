#include "ControlPlaneMessages.hpp"

#include "TimeUtils.hpp"

#include <stdexcept>
#include <utility>

namespace {
void RequireIdentifiers(const Uuid& commandId, const Uuid& nodeId) {
    if (commandId.IsNil()) {
        throw std::invalid_argument("CommandId cannot be empty");
    }
    if (nodeId.IsNil()) {
        throw std::invalid_argument("NodeId cannot be empty");
    }
}

std::chrono::system_clock::time_point CompletedNoEarlierThan(std::chrono::system_clock::time_point startedAt) {
    const auto now = std::chrono::system_clock::now();
    return now < startedAt ? startedAt : now;
}

template <typename T>
void PutOptional(nlohmann::json& json, const char* key, const std::optional<T>& value) {
    if (value) {
        json[key] = *value;
    } else {
        json[key] = nullptr;
    }
}
} // namespace

CommandResult CommandResult::Success(
    const Uuid& commandId,
    const Uuid& nodeId,
    std::chrono::system_clock::time_point startedAt,
    std::optional<std::string> resultJson,
    std::optional<std::string> correlationId) {
    RequireIdentifiers(commandId, nodeId);

    CommandResult result;
    result.commandId = commandId;
    result.nodeId = nodeId;
    result.status = CommandResultStatus::Succeeded;
    result.startedAt = startedAt;
    result.completedAt = CompletedNoEarlierThan(startedAt);
    result.resultJson = std::move(resultJson);
    result.correlationId = std::move(correlationId);
    return result;
}

CommandResult CommandResult::Failure(
    const Uuid& commandId,
    const Uuid& nodeId,
    std::chrono::system_clock::time_point startedAt,
    std::string errorMessage,
    std::optional<std::string> errorCode,
    std::optional<std::string> correlationId) {
    RequireIdentifiers(commandId, nodeId);

    CommandResult result;
    result.commandId = commandId;
    result.nodeId = nodeId;
    result.status = CommandResultStatus::Failed;
    result.startedAt = startedAt;
    result.completedAt = CompletedNoEarlierThan(startedAt);
    result.errorMessage = std::move(errorMessage);
    result.errorCode = std::move(errorCode);
    result.correlationId = std::move(correlationId);
    return result;
}

CommandResult CommandResult::Rejected(
    const Uuid& commandId,
    const Uuid& nodeId,
    std::string errorMessage,
    std::optional<std::string> errorCode,
    std::optional<std::string> correlationId) {
    RequireIdentifiers(commandId, nodeId);

    const auto now = std::chrono::system_clock::now();
    CommandResult result;
    result.commandId = commandId;
    result.nodeId = nodeId;
    result.status = CommandResultStatus::Rejected;
    result.startedAt = now;
    result.completedAt = now;
    result.errorMessage = std::move(errorMessage);
    result.errorCode = std::move(errorCode);
    result.correlationId = std::move(correlationId);
    return result;
}

uint64_t SystemMetrics::UsedMemoryBytes() const {
    return totalMemoryBytes > availableMemoryBytes ? totalMemoryBytes - availableMemoryBytes : 0;
}

double SystemMetrics::MemoryUsagePercent() const {
    if (totalMemoryBytes == 0) {
        return 0.0;
    }
    return static_cast<double>(UsedMemoryBytes()) / static_cast<double>(totalMemoryBytes) * 100.0;
}

const char* ToString(CommandResultStatus status) {
    switch (status) {
    case CommandResultStatus::Succeeded:
        return "Succeeded";
    case CommandResultStatus::Failed:
        return "Failed";
    case CommandResultStatus::Rejected:
        return "Rejected";
    case CommandResultStatus::TimedOut:
        return "TimedOut";
    case CommandResultStatus::Cancelled:
        return "Cancelled";
    }
    return "Failed";
}

const char* ToString(NodeStatus status) {
    switch (status) {
    case NodeStatus::Online:
        return "Online";
    case NodeStatus::Degraded:
        return "Degraded";
    case NodeStatus::Starting:
        return "Starting";
    case NodeStatus::ShuttingDown:
        return "ShuttingDown";
    case NodeStatus::Maintenance:
        return "Maintenance";
    }
    return "Online";
}

const char* ToString(TelemetryEventLevel level) {
    switch (level) {
    case TelemetryEventLevel::Debug:
        return "Debug";
    case TelemetryEventLevel::Information:
        return "Information";
    case TelemetryEventLevel::Warning:
        return "Warning";
    case TelemetryEventLevel::Error:
        return "Error";
    case TelemetryEventLevel::Critical:
        return "Critical";
    }
    return "Information";
}

void to_json(nlohmann::json& json, const CommandResult& result) {
    json = {
        {"commandId", result.commandId.ToString()},
        {"nodeId", result.nodeId.ToString()},
        {"status", ToString(result.status)},
        {"startedAt", FormatIso8601(result.startedAt)},
        {"completedAt", FormatIso8601(result.completedAt)}
    };
    PutOptional(json, "resultJson", result.resultJson);
    PutOptional(json, "errorMessage", result.errorMessage);
    PutOptional(json, "errorCode", result.errorCode);
    PutOptional(json, "correlationId", result.correlationId);
}

void to_json(nlohmann::json& json, const SystemMetrics& metrics) {
    nlohmann::json disks = nlohmann::json::array();
    for (const auto& disk : metrics.disks) {
        disks.push_back({
            {"name", disk.name},
            {"totalBytes", disk.totalBytes},
            {"availableBytes", disk.availableBytes},
            {"usedBytes", disk.totalBytes > disk.availableBytes ? disk.totalBytes - disk.availableBytes : 0}
        });
    }

    json = {
        {"cpuUsagePercent", metrics.cpuUsagePercent},
        {"totalMemoryBytes", metrics.totalMemoryBytes},
        {"availableMemoryBytes", metrics.availableMemoryBytes},
        {"usedMemoryBytes", metrics.UsedMemoryBytes()},
        {"memoryUsagePercent", metrics.MemoryUsagePercent()},
        {"disks", std::move(disks)},
        {"systemUptimeSeconds", metrics.systemUptime.count()},
        {"processorCount", metrics.processorCount},
        {"osDescription", metrics.osDescription}
    };
}

void to_json(nlohmann::json& json, const HeartbeatPayload& payload) {
    json = {
        {"nodeId", payload.nodeId.ToString()},
        {"agentVersion", payload.agentVersion},
        {"timestamp", FormatIso8601(payload.timestamp)},
        {"status", ToString(payload.status)},
        {"warnings", payload.warnings}
    };
    if (payload.metrics) {
        json["metrics"] = *payload.metrics;
    } else {
        json["metrics"] = nullptr;
    }
}

void to_json(nlohmann::json& json, const TelemetryEvent& event) {
    json = {
        {"name", event.name},
        {"timestamp", FormatIso8601(event.timestamp)},
        {"level", ToString(event.level)},
        {"properties", event.properties}
    };
}

void to_json(nlohmann::json& json, const TelemetryPayload& payload) {
    json = {
        {"nodeId", payload.nodeId.ToString()},
        {"timestamp", FormatIso8601(payload.timestamp)},
        {"metrics", payload.metrics},
        {"events", payload.events}
    };
}
