#pragma once

#include "Uuid.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class CommandResultStatus {
    Succeeded,
    Failed,
    Rejected,
    TimedOut,
    Cancelled
};

struct CommandResult {
    Uuid commandId;
    Uuid nodeId;
    CommandResultStatus status = CommandResultStatus::Failed;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point completedAt;
    std::optional<std::string> resultJson;
    std::optional<std::string> errorMessage;
    std::optional<std::string> errorCode;
    std::optional<std::string> correlationId;

    // The factories throw std::invalid_argument for a nil command or node id.
    static CommandResult Success(
        const Uuid& commandId,
        const Uuid& nodeId,
        std::chrono::system_clock::time_point startedAt,
        std::optional<std::string> resultJson = std::nullopt,
        std::optional<std::string> correlationId = std::nullopt);
    static CommandResult Failure(
        const Uuid& commandId,
        const Uuid& nodeId,
        std::chrono::system_clock::time_point startedAt,
        std::string errorMessage,
        std::optional<std::string> errorCode = std::nullopt,
        std::optional<std::string> correlationId = std::nullopt);
    static CommandResult Rejected(
        const Uuid& commandId,
        const Uuid& nodeId,
        std::string errorMessage,
        std::optional<std::string> errorCode = std::nullopt,
        std::optional<std::string> correlationId = std::nullopt);
};

enum class NodeStatus {
    Online,
    Degraded,
    Starting,
    ShuttingDown,
    Maintenance
};

struct DiskMetrics {
    std::string name;
    uint64_t totalBytes = 0;
    uint64_t availableBytes = 0;
};

struct SystemMetrics {
    double cpuUsagePercent = 0.0;
    uint64_t totalMemoryBytes = 0;
    uint64_t availableMemoryBytes = 0;
    std::vector<DiskMetrics> disks;
    std::chrono::seconds systemUptime{0};
    int processorCount = 0;
    std::string osDescription;

    uint64_t UsedMemoryBytes() const;
    double MemoryUsagePercent() const;
};

struct HeartbeatPayload {
    Uuid nodeId;
    std::string agentVersion;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    NodeStatus status = NodeStatus::Online;
    std::optional<SystemMetrics> metrics;
    std::vector<std::string> warnings;
};

enum class TelemetryEventLevel {
    Debug,
    Information,
    Warning,
    Error,
    Critical
};

struct TelemetryEvent {
    std::string name;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    TelemetryEventLevel level = TelemetryEventLevel::Information;
    std::map<std::string, std::string> properties;
};

struct TelemetryPayload {
    Uuid nodeId;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::map<std::string, double> metrics;
    std::vector<TelemetryEvent> events;
};

const char* ToString(CommandResultStatus status);
const char* ToString(NodeStatus status);
const char* ToString(TelemetryEventLevel level);

void to_json(nlohmann::json& json, const CommandResult& result);
void to_json(nlohmann::json& json, const SystemMetrics& metrics);
void to_json(nlohmann::json& json, const HeartbeatPayload& payload);
void to_json(nlohmann::json& json, const TelemetryEvent& event);
void to_json(nlohmann::json& json, const TelemetryPayload& payload);
